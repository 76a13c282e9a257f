// frontend/src/os/file.cpp
#include <zigmin/os/File.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>


namespace zigmin::os {

    namespace {

        void normalize_newlines_inplace(std::string& s) {
            // CRLF -> LF; a lone CR is whitespace to the lexer and must keep separating tokens
            std::string out;
            out.reserve(s.size());
            for (size_t i = 0; i < s.size(); ++i) {
                if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') continue;
                out.push_back(s[i]);
            }
            s.swap(out);
        }

        ReadTextResult too_large(std::size_t max_bytes) {
            ReadTextResult r{};
            r.code = diag::Code::kSourceTooLarge;
            r.err = std::to_string(max_bytes);
            return r;
        }

    } // namespace

    ReadTextResult read_text_file(std::string_view path, std::size_t max_bytes) {
        ReadTextResult r{};

        std::FILE* fp = std::fopen(std::string(path).c_str(), "rb");
        if (!fp) {
            r.err = std::string("cannot open file: ") + std::strerror(errno);
            return r;
        }

        std::fseek(fp, 0, SEEK_END);
        const long sz = std::ftell(fp);
        std::fseek(fp, 0, SEEK_SET);
        if (sz < 0) {
            std::fclose(fp);
            r.err = "cannot read file size";
            return r;
        }

        if (static_cast<unsigned long>(sz) > max_bytes) {
            std::fclose(fp);
            return too_large(max_bytes);
        }

        r.text.resize(static_cast<std::size_t>(sz));
        const std::size_t n = std::fread(r.text.data(), 1, r.text.size(), fp);
        std::fclose(fp);

        if (n != r.text.size()) {
            r.text.clear();
            r.err = "short read";
            return r;
        }

        normalize_newlines_inplace(r.text);
        r.ok = true;
        return r;
    }

    ReadTextResult read_text_stream(std::istream& in, std::size_t max_bytes) {
        ReadTextResult r{};

        char buf[4096];
        while (in) {
            in.read(buf, sizeof(buf));
            const std::size_t n = static_cast<std::size_t>(in.gcount());
            if (r.text.size() + n > max_bytes) return too_large(max_bytes);
            r.text.append(buf, n);
        }

        if (in.bad()) {
            r.text.clear();
            r.err = "read error";
            return r;
        }

        normalize_newlines_inplace(r.text);
        r.ok = true;
        return r;
    }

    bool write_text_file(const std::string& path, std::string_view text) {
        std::ofstream ofs(path, std::ios::binary);
        if (!ofs) return false;
        ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
        return ofs.good();
    }

} // namespace zigmin::os
