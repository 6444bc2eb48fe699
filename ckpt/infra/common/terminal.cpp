// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <cstdio>

#include <unistd.h>

namespace ckpt {

bool is_terminal(int fd) {
    return isatty(fd);
}

static bool is_terminal_stream(FILE* stream) {
    return is_terminal(fileno(stream));
}

bool is_terminal_stdout() {
    return is_terminal_stream(stdout);
}

bool is_terminal_stderr() {
    return is_terminal_stream(stderr);
}

}  // namespace ckpt
