/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdio>
#include <filesystem>
#include <amf/file.hpp>
#include <amf/logger.hpp>

namespace amf_turbo::file {
    struct stdio_file {
        stdio_file(const std::string &path, const char *mode):
            _f { std::fopen(path.c_str(), mode) }
        {
            if (!_f)
                throw error_sys(fmt::format("failed to open file {}", path));
        }

        ~stdio_file()
        {
            if (_f)
                std::fclose(_f);
        }

        stdio_file(const stdio_file &) =delete;

        std::FILE *get() const noexcept
        {
            return _f;
        }
    private:
        std::FILE *_f;
    };

    void read(const std::string &path, uint8_vector &buf)
    {
        const auto size = std::filesystem::file_size(path);
        stdio_file f { path, "rb" };
        buf.resize(size);
        if (size && std::fread(buf.data(), 1, size, f.get()) != size)
            throw error_sys(fmt::format("failed to read {} bytes from {}", size, path));
    }

    void write(const std::string &path, const buffer &buf)
    {
        stdio_file f { path, "wb" };
        if (!buf.empty() && std::fwrite(buf.data(), 1, buf.size(), f.get()) != buf.size())
            throw error_sys(fmt::format("failed to write {} bytes to {}", buf.size(), path));
    }

    tmp::tmp(const std::string &name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        if (!std::filesystem::remove(_path, ec) && ec)
            logger::warn("failed to remove a temporary file {}: {}", _path, ec.message());
    }
}
