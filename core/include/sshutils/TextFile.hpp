// Open-mode parsing and the text/binary file wrapper returned by FileSystem::openFile.
// TextFile decorates a raw FileHandle and decodes on read (iconv) in text mode.
#pragma once
#include "SftpClient.hpp"
#include <iconv.h>
#include <memory>
#include <string>

namespace sshutils {

enum class DecodeErrors {
    Strict,   // undecodable input is a Decode error
    Replace,  // replaced with U+FFFD
    Ignore    // dropped
};

bool parseDecodeErrors(const std::string& s, DecodeErrors& out, Error& err);

struct OpenSpec {
    OpenFlags flags;
    bool binary = false;
    std::string encoding = "utf-8";
    DecodeErrors errors = DecodeErrors::Strict;

    // Mode strings "r", "w", "a", "x" with optional "+" and "b"/"t".
    static bool parse(const std::string& mode, OpenSpec& out, Error& err);
};

class TextFile {
public:
    TextFile(std::unique_ptr<FileHandle> raw, OpenSpec spec, std::string path);
    ~TextFile();

    TextFile(const TextFile&) = delete;
    TextFile& operator=(const TextFile&) = delete;

    // Whole remaining content; UTF-8 text in text mode, raw bytes in binary mode.
    bool read(std::string& out, Error& err);
    // Up to n raw bytes from the file, decoded; may return less at a split sequence.
    bool readChunk(std::size_t n, std::string& out, bool& eof, Error& err);
    // UTF-8 text encoded to the file encoding (bytes as-is in binary mode).
    bool write(const std::string& data, Error& err);
    bool close(Error& err);

    bool binary() const { return spec_.binary; }
    const std::string& path() const { return path_; }
    const OpenSpec& spec() const { return spec_; }

private:
    std::unique_ptr<FileHandle> raw_;
    OpenSpec spec_;
    std::string path_;
    std::string pending_; // incomplete multi-byte tail from the previous chunk
    iconv_t dec_ = reinterpret_cast<iconv_t>(-1);
    iconv_t enc_ = reinterpret_cast<iconv_t>(-1);

    bool decode(bool final, std::string& out, Error& err);
};

} // namespace sshutils
