/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <amf/cli/common.hpp>
#include <amf/config.hpp>

namespace amf_turbo::cli::common {
    void add_opts(config &cmd)
    {
        cmd.opts.try_emplace("max-depth", "the maximum nesting level of arrays", std::optional<std::string> {}, validate_positive_int);
        cmd.opts.try_emplace("config", "a JSON file with the maxDepth and doubleByteOrder decoder settings");
    }

    amf3::options decoder_opts(const options &opts)
    {
        amf3::options dec_opts {};
        if (const auto it = opts.find("config"); it != opts.end()) {
            if (!it->second)
                throw error("--config requires a path");
            dec_opts = amf3::options::from_config(config_file { *it->second });
        }
        if (const auto it = opts.find("max-depth"); it != opts.end() && it->second)
            dec_opts.max_depth = std::stoull(*it->second);
        logger::debug("decoder options: max depth: {} double byte order: {}", dec_opts.max_depth,
            dec_opts.double_order == amf3::byte_order::little ? "little" : "big");
        return dec_opts;
    }
}
