#include "minitest.hpp"
#include "ui/Display.hpp"
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

using sysglyph::model::Frame;
using sysglyph::model::Style;

TEST(display_compose_plain) {
  Frame f{"ab", "cd"};
  auto out = sysglyph::ui::compose_frame_output(f, Style::Waves, false);
  ASSERT_EQ(out, "\x1B[H\x1B[2J\x1B[1;1Hab\x1B[2;1Hcd");
}

TEST(display_compose_row_colours) {
  Frame f{"ab", "cd", "ef", "gh"};
  auto out = sysglyph::ui::compose_frame_output(f, Style::Waves, true);
  // waves: Blue, Cyan, Black, then wraps
  ASSERT_EQ(out,
    "\x1B[H\x1B[2J"
    "\x1B[1;1H\x1B[104mab\x1B[0m"
    "\x1B[2;1H\x1B[106mcd\x1B[0m"
    "\x1B[3;1H\x1B[40mef\x1B[0m"
    "\x1B[4;1H\x1B[104mgh\x1B[0m");
}

TEST(display_compose_ember_dark_colours) {
  Frame f{"x"};
  auto out = sysglyph::ui::compose_frame_output(f, Style::Ember, true);
  ASSERT_EQ(out, "\x1B[H\x1B[2J\x1B[1;1H\x1B[41mx\x1B[0m");
}

TEST(display_writes_to_pipe) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  Frame f{"hi"};
  ASSERT_TRUE(sysglyph::ui::display_frame(fds[1], f, Style::Plasma));
  char buf[64]{};
  ssize_t n = ::read(fds[0], buf, sizeof(buf));
  ::close(fds[0]);
  ::close(fds[1]);
  ASSERT_EQ(std::string(buf, static_cast<size_t>(n)), "\x1B[H\x1B[2J\x1B[1;1Hhi");
}

TEST(display_reports_write_failure) {
  int fd = ::open("/dev/null", O_WRONLY);
  ASSERT_TRUE(fd >= 0);
  ::close(fd);
  Frame f{"hi"};
  ASSERT_TRUE(!sysglyph::ui::display_frame(fd, f, Style::Plasma));
}
