#ifndef CHUNKZLI_TERMINAL_HPP
#define CHUNKZLI_TERMINAL_HPP

#include <sys/ioctl.h>
#include <unistd.h>

#define RESET  "\033[0m"
#define RED    "\033[31m"
#define GREEN  "\033[32m"
#define YELLOW "\033[33m"

// width of the terminal attached to stderr, 80 if unknown
inline unsigned get_terminal_width() {
    winsize w{};
    if (::ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 80;
}

#endif // CHUNKZLI_TERMINAL_HPP
