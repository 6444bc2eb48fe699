// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "human_size_option.hpp"

#include <absl/strings/str_cat.h>

#include <ckpt/core/common/util.hpp>

namespace ckpt::cmd::common {

static std::string range_description(size_t min_size, size_t max_size) {
    return absl::StrCat("range [", human_size(min_size), " - ", human_size(max_size), "]");
}

std::string validate_human_size(const std::string& value, size_t min_size, size_t max_size) {
    const auto parsed_size = parse_size(value);
    if (!parsed_size) {
        return absl::StrCat("Value ", value, " is not a parseable size");
    }
    if (*parsed_size < min_size || *parsed_size > max_size) {
        return absl::StrCat("Value ", value, " not in ", range_description(min_size, max_size));
    }
    return {};
}

HumanSizeParserValidator::HumanSizeParserValidator(size_t min_size, size_t max_size) {
    description(range_description(min_size, max_size));
    func_ = [=](const std::string& value) { return validate_human_size(value, min_size, max_size); };
}

CLI::Option* add_option_human_size(CLI::App& cli,
                                   const std::string& name,
                                   size_t& value,
                                   size_t min_size,
                                   size_t max_size,
                                   const std::string& description) {
    CLI::Option* option = cli.add_option(name, [&value](const CLI::results_t& results) {
        const auto parsed_size = parse_size(results[0]);
        if (parsed_size) {
            value = static_cast<size_t>(*parsed_size);
        }
        return parsed_size.has_value();
    });
    option->description(description);
    option->default_str(human_size(value));
    option->check(HumanSizeParserValidator{min_size, max_size});
    return option;
}

}  // namespace ckpt::cmd::common
