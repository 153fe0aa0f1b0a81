#pragma once

namespace braille {
namespace input {

// Puts stdin into unbuffered, no-echo mode until restore_stdin().
void setup_nonblocking_stdin();
void restore_stdin();

// Returns the next pending byte, or -1 when no key is waiting.
int read_key();

constexpr int KEY_ESCAPE = 27;

}
}
