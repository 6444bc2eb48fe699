// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include <ckpt/core/common/bytes.hpp>
#include <ckpt/core/common/util.hpp>
#include <ckpt/infra/cli/common.hpp>
#include <ckpt/infra/cli/human_size_option.hpp>
#include <ckpt/infra/common/log.hpp>
#include <ckpt/state/checkpoint_stream_factory.hpp>
#include <ckpt/state/local_file_system.hpp>

using namespace ckpt;
using namespace ckpt::cmd::common;

//! The settings for the checkpoint writer tool
struct CheckpointWriteSettings {
    log::Settings log_settings;
    state::CheckpointStreamSettings stream_settings;
    std::string input{"-"};
    size_t chunk_size{4_Kibi};
    uint64_t checkpoint_id{1};
    bool discard{false};
};

CheckpointWriteSettings parse_cli_settings(int argc, char* argv[]) {
    CLI::App cli{"Checkpoint state writer: writes input bytes into a checkpoint state stream"};

    try {
        CheckpointWriteSettings settings;
        add_logging_options(cli, settings.log_settings);
        add_option_checkpoint_dir(cli, settings.stream_settings.checkpoint_dir);

        add_option_human_size(cli, "--threshold", settings.stream_settings.file_state_threshold,
                              0, state::kMaxFileStateThreshold,
                              "State up to this size is returned inline instead of being written to file");
        add_option_human_size(cli, "--buffer", settings.stream_settings.write_buffer_size,
                              1, kGibi, "The minimum size of the stream write buffer");
        add_option_human_size(cli, "--chunk", settings.chunk_size,
                              1, kGibi, "The size of the chunks read from input and written into the stream");

        cli.add_option("--input", settings.input, "The input file path, '-' reads from standard input")
            ->capture_default_str();
        cli.add_option("--checkpoint", settings.checkpoint_id, "The checkpoint identifier")
            ->capture_default_str();
        cli.add_flag("--discard", settings.discard, "Discard the written state instead of committing it");

        cli.parse(argc, argv);
        return settings;
    } catch (const CLI::ParseError& pe) {
        cli.exit(pe);
        throw;
    }
}

//! Write the whole \p input into \p stream in chunks of \p chunk_size bytes
static void write_input(std::istream& input, size_t chunk_size, state::CheckpointStateOutputStream& stream) {
    std::vector<char> chunk(chunk_size);
    while (input) {
        input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto count = static_cast<size_t>(input.gcount());
        if (count > 0) {
            stream.write(string_view_to_byte_view(std::string_view{chunk.data(), count}));
        }
    }
    if (input.bad()) {
        throw std::runtime_error{"error reading input"};
    }
}

int main(int argc, char* argv[]) {
    try {
        CheckpointWriteSettings settings = parse_cli_settings(argc, argv);
        log::init(settings.log_settings);

        state::LocalFileSystem fs;
        const state::FsCheckpointStreamFactory factory{fs, settings.stream_settings};
        log::Info("Checkpoint stream factory", {"factory", factory.to_string(),
                                                "threshold", human_size(factory.file_state_threshold()),
                                                "buffer", human_size(factory.buffer_size())});

        const auto timestamp = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
                .count());
        const auto stream = factory.create_checkpoint_state_output_stream(settings.checkpoint_id, timestamp);

        if (settings.input == "-") {
            write_input(std::cin, settings.chunk_size, *stream);
        } else {
            std::ifstream input_file{settings.input, std::ios::binary};
            if (!input_file) {
                throw std::runtime_error{"cannot open input file: " + settings.input};
            }
            write_input(input_file, settings.chunk_size, *stream);
        }

        if (settings.discard) {
            const auto written = stream->position();
            stream->close();
            log::Info("Checkpoint state discarded", {"bytes", std::to_string(written)});
            return 0;
        }

        const auto handle = stream->close_and_get_handle();
        if (!handle) {
            log::Info("Checkpoint state is empty, no handle produced");
            return 0;
        }
        const int64_t size{state::state_size(*handle)};
        log::Info("Checkpoint state committed", {"size", size < 0 ? "unknown" : human_size(static_cast<uint64_t>(size))});
        std::cout << state::to_string(*handle) << "\n"
                  << std::flush;
        return 0;
    } catch (const CLI::ParseError&) {
        return -1;
    } catch (const std::exception& e) {
        log::Critical() << "CheckpointWrite exiting due to exception: " << e.what();
        return -2;
    }
}
