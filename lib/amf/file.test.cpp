/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <amf/common/test.hpp>
#include <amf/file.hpp>

using namespace amf_turbo;

suite file_suite = [] {
    "file"_test = [] {
        "write and read"_test = [] {
            const file::tmp tmp_f { "file-write-read-test.amf3" };
            const auto data = uint8_vector::from_hex("0901036104050362040701");
            file::write(tmp_f.path(), data);
            test_same(std::filesystem::file_size(tmp_f.path()), data.size());
            test_same(file::read(tmp_f.path()), data);
        };
        "empty file"_test = [] {
            const file::tmp tmp_f { "file-empty-test.amf3" };
            file::write(tmp_f.path(), buffer {});
            expect(file::read(tmp_f.path()).empty());
        };
        "tmp"_test = [] {
            std::string tmp_path {};
            {
                file::tmp tmp1 { "hello.txt" };
                tmp_path = tmp1.path();
                expect(!std::filesystem::exists(tmp1.path()));
                file::write(tmp1.path(), std::string_view { "Hello\n" });
                expect(std::filesystem::exists(tmp1.path()));
                expect(std::filesystem::file_size(tmp1.path()));
            }
            expect(!std::filesystem::exists(tmp_path));
        };
        "missing file"_test = [] {
            expect(throws([] { file::read("./missing-dir/missing-file.amf3"); }));
            expect(throws<error_sys>([] { file::write("./missing-dir/missing-file.amf3", std::string_view { "abc" }); }));
        };
    };
};
