// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace ckpt::state {

enum class StreamError {
    kClosed,             // operation attempted on a terminated stream
    kCreationExhausted,  // no unique state file could be created within the attempt limit
    kCommitFailed,       // flushing or closing the state file failed while obtaining the handle
    kNoSink,             // operation requires the state file but nothing has been flushed yet
};

class StreamException : public std::runtime_error {
  public:
    explicit StreamException(StreamError err, const std::string& message = "");

    StreamError err() const noexcept { return err_; }

  private:
    StreamError err_;
};

}  // namespace ckpt::state
