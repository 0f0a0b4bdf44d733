/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <amf/amf3/value.hpp>
#include <amf/cli.hpp>
#include <amf/cli/common.hpp>
#include <amf/file.hpp>
#include <amf/json.hpp>

namespace amf_turbo::cli::decode {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "decode";
            cmd.desc = "decode the first AMF3 value of a file and print it as JSON";
            cmd.args.expect({ "<path>" });
            common::add_opts(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto data = file::read(args.at(0));
            const auto val = amf3::parse(data, common::decoder_opts(opts));
            json::save_pretty(std::cout, amf3::to_json(val));
            std::cout << '\n';
            std::cout.flush();
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
