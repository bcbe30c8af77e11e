#include "minitest.hpp"
#include "collectors/NetCollector.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root_net() {
  auto root = fs::temp_directory_path() / fs::path("sysglyph_test_net_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc/net");
  return root;
}

static const char* kNetHeader =
  "Inter-|   Receive                                                |  Transmit\n"
  " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n";

TEST(net_collector_parses_and_deltas) {
  auto root = make_root_net();
  std::ofstream(root / "proc/net/dev") << kNetHeader <<
    "    lo: 5000 0 0 0 0 0 0 0  5000 0 0 0 0 0 0 0\n"
    "  eth0: 1000 0 0 0 0 0 0 0  2000 0 0 0 0 0 0 0\n";
  setenv("SYSGLYPH_PROC_ROOT", root.c_str(), 1);
  sysglyph::collectors::NetCollector c; sysglyph::model::NetSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.interfaces.size(), 1u); // loopback skipped
  ASSERT_EQ(s.interfaces[0].name, "eth0");
  ASSERT_EQ(s.agg_rx_bps, 0.0);
  std::this_thread::sleep_for(std::chrono::milliseconds(120));
  std::ofstream(root / "proc/net/dev") << kNetHeader <<
    "    lo: 9000 0 0 0 0 0 0 0  9000 0 0 0 0 0 0 0\n"
    "  eth0: 11000 0 0 0 0 0 0 0  32000 0 0 0 0 0 0 0\n";
  ASSERT_TRUE(c.sample(s));
  ASSERT_TRUE(s.agg_rx_bps > 0.0 && s.agg_tx_bps > 0.0);
  ASSERT_TRUE(s.agg_tx_bps > s.agg_rx_bps);
  unsetenv("SYSGLYPH_PROC_ROOT");
}

TEST(net_collector_counter_reset_yields_no_rate) {
  auto root = make_root_net();
  std::ofstream(root / "proc/net/dev") << kNetHeader <<
    "  eth0: 90000 0 0 0 0 0 0 0  90000 0 0 0 0 0 0 0\n";
  setenv("SYSGLYPH_PROC_ROOT", root.c_str(), 1);
  sysglyph::collectors::NetCollector c; sysglyph::model::NetSnapshot s{};
  ASSERT_TRUE(c.sample(s));
  std::ofstream(root / "proc/net/dev") << kNetHeader <<
    "  eth0: 10 0 0 0 0 0 0 0  10 0 0 0 0 0 0 0\n";
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.agg_rx_bps, 0.0);
  ASSERT_EQ(s.agg_tx_bps, 0.0);
  unsetenv("SYSGLYPH_PROC_ROOT");
}
