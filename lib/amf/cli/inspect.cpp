/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iterator>
#include <amf/amf3/value.hpp>
#include <amf/cli.hpp>
#include <amf/cli/common.hpp>
#include <amf/file.hpp>

namespace amf_turbo::cli::inspect {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "inspect";
            cmd.desc = "print the first AMF3 value of a file as a tree along with the decoding statistics";
            cmd.args.expect({ "<path>" });
            cmd.opts.try_emplace("max-items", "the maximum number of expanded elements per array", std::optional<std::string> {}, validate_positive_int);
            common::add_opts(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto data = file::read(args.at(0));
            size_t max_items = std::numeric_limits<size_t>::max();
            if (const auto it = opts.find("max-items"); it != opts.end() && it->second)
                max_items = std::stoull(*it->second);
            amf3::decoder dec { data, common::decoder_opts(opts) };
            amf3::value val {};
            amf3::value_builder builder { val };
            dec.decode(builder);
            std::string text {};
            amf3::format_to(std::back_inserter(text), val, 0, max_items);
            const auto &in = dec.input();
            std::cout << fmt::format("{}\nvalue size: {} bytes, trailing bytes: {}, interned strings: {}\n",
                text, in.offset(), in.remaining(), in.strings().size());
            std::cout.flush();
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
