#include "terminal/input.hpp"

#ifdef _WIN32
#include <windows.h>
#include <conio.h>
#else
#include <sys/select.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace braille {
namespace input {

#ifdef _WIN32
static DWORD original_mode = 0;
static HANDLE h_stdin = nullptr;
static bool console_modified = false;

void setup_nonblocking_stdin() {
    h_stdin = GetStdHandle(STD_INPUT_HANDLE);
    if (h_stdin == INVALID_HANDLE_VALUE) return;
    if (!GetConsoleMode(h_stdin, &original_mode)) return;
    SetConsoleMode(h_stdin, original_mode & ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT));
    console_modified = true;
}

void restore_stdin() {
    if (console_modified && h_stdin != nullptr) {
        SetConsoleMode(h_stdin, original_mode);
        console_modified = false;
    }
}

int read_key() {
    if (_kbhit()) {
        return _getch();
    }
    return -1;
}
#else
static termios original_termios;
static bool termios_modified = false;

void setup_nonblocking_stdin() {
    if (!isatty(STDIN_FILENO)) return;
    if (tcgetattr(STDIN_FILENO, &original_termios) != 0) return;
    termios new_termios = original_termios;
    new_termios.c_lflag &= ~(ICANON | ECHO);
    new_termios.c_cc[VMIN] = 0;
    new_termios.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &new_termios) == 0) {
        termios_modified = true;
    }
}

void restore_stdin() {
    if (termios_modified) {
        tcsetattr(STDIN_FILENO, TCSANOW, &original_termios);
        termios_modified = false;
    }
}

int read_key() {
    timeval tv = {0, 0};
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(STDIN_FILENO, &fds);

    if (select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv) > 0) {
        unsigned char c;
        if (read(STDIN_FILENO, &c, 1) == 1) {
            return c;
        }
    }
    return -1;
}
#endif

}
}
