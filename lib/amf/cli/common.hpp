/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifndef AMF_TURBO_CLI_COMMON_HPP
#define AMF_TURBO_CLI_COMMON_HPP

#include <amf/amf3/types.hpp>
#include <amf/cli.hpp>

namespace amf_turbo::cli::common {
    extern void add_opts(config &cmd);
    // --config is applied first and --max-depth overrides its maxDepth
    extern amf3::options decoder_opts(const options &opts);
}

#endif // !AMF_TURBO_CLI_COMMON_HPP
