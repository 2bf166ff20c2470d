#include "sshutils/TextFile.hpp"
#include <cerrno>
#include <strings.h>
#include <vector>

namespace sshutils {

namespace {

const iconv_t kNoConv = reinterpret_cast<iconv_t>(-1);
const char kReplacement[] = "\xEF\xBF\xBD";

bool isUtf8Name(const std::string& enc) {
    return strcasecmp(enc.c_str(), "utf-8") == 0 || strcasecmp(enc.c_str(), "utf8") == 0;
}

} // namespace

bool parseDecodeErrors(const std::string& s, DecodeErrors& out, Error& err) {
    if (s == "strict") out = DecodeErrors::Strict;
    else if (s == "replace") out = DecodeErrors::Replace;
    else if (s == "ignore") out = DecodeErrors::Ignore;
    else {
        err.set(ErrorKind::InvalidArgument, "unknown error policy '" + s + "'");
        return false;
    }
    return true;
}

bool OpenSpec::parse(const std::string& mode, OpenSpec& out, Error& err) {
    OpenSpec spec;
    int primary = 0;
    bool plus = false, text = false;
    for (char c : mode) {
        switch (c) {
            case 'r': ++primary; spec.flags = OpenFlags{}; break;
            case 'w': ++primary; spec.flags = OpenFlags{false, true, false, true, true, false}; break;
            case 'a': ++primary; spec.flags = OpenFlags{false, true, true, true, false, false}; break;
            case 'x': ++primary; spec.flags = OpenFlags{false, true, false, true, false, true}; break;
            case '+': plus = true; break;
            case 'b': spec.binary = true; break;
            case 't': text = true; break;
            default:
                err.set(ErrorKind::InvalidArgument, "invalid mode '" + mode + "'");
                return false;
        }
    }
    if (primary != 1 || (spec.binary && text)) {
        err.set(ErrorKind::InvalidArgument, "invalid mode '" + mode + "'");
        return false;
    }
    if (plus) {
        spec.flags.read = true;
        spec.flags.write = true;
    }
    spec.encoding = out.encoding;
    spec.errors = out.errors;
    out = spec;
    return true;
}

TextFile::TextFile(std::unique_ptr<FileHandle> raw, OpenSpec spec, std::string path)
    : raw_(std::move(raw)), spec_(std::move(spec)), path_(std::move(path)) {
    if (spec_.binary) return;
    dec_ = iconv_open("UTF-8", spec_.encoding.c_str());
    if (!isUtf8Name(spec_.encoding)) enc_ = iconv_open(spec_.encoding.c_str(), "UTF-8");
}

TextFile::~TextFile() {
    Error ignored;
    if (raw_) raw_->close(ignored);
    if (dec_ != kNoConv) iconv_close(dec_);
    if (enc_ != kNoConv) iconv_close(enc_);
}

bool TextFile::decode(bool final, std::string& out, Error& err) {
    if (dec_ == kNoConv) {
        err.set(ErrorKind::InvalidArgument, "unknown encoding '" + spec_.encoding + "'");
        return false;
    }
    std::vector<char> obuf(pending_.size() * 4 + 16);
    char* in = &pending_[0];
    size_t inLeft = pending_.size();
    while (inLeft > 0) {
        char* op = obuf.data();
        size_t outLeft = obuf.size();
        size_t rc = iconv(dec_, &in, &inLeft, &op, &outLeft);
        out.append(obuf.data(), obuf.size() - outLeft);
        if (rc != static_cast<size_t>(-1)) continue;
        if (errno == E2BIG) continue;
        if (errno == EINVAL && !final) break; // incomplete tail; wait for more bytes
        // EILSEQ, or a truncated sequence at end of file
        const size_t offset = pending_.size() - inLeft;
        if (spec_.errors == DecodeErrors::Strict) {
            err.set(ErrorKind::Decode, "'" + spec_.encoding + "' codec can't decode byte at offset " +
                                           std::to_string(offset) + " in " + path_);
            return false;
        }
        if (spec_.errors == DecodeErrors::Replace) out += kReplacement;
        ++in;
        --inLeft;
        iconv(dec_, nullptr, nullptr, nullptr, nullptr);
    }
    pending_.erase(0, pending_.size() - inLeft);
    return true;
}

bool TextFile::readChunk(std::size_t n, std::string& out, bool& eof, Error& err) {
    out.clear();
    eof = false;
    if (!raw_) {
        err.set(ErrorKind::InvalidArgument, "read on closed file " + path_);
        return false;
    }
    std::vector<char> buf(n ? n : 1);
    std::size_t got = 0;
    if (!raw_->read(buf.data(), buf.size(), got, err)) return false;
    eof = got == 0;
    if (spec_.binary) {
        out.assign(buf.data(), got);
        return true;
    }
    pending_.append(buf.data(), got);
    return decode(eof, out, err);
}

bool TextFile::read(std::string& out, Error& err) {
    out.clear();
    bool eof = false;
    std::string part;
    while (!eof) {
        if (!readChunk(64 * 1024, part, eof, err)) return false;
        out += part;
    }
    return true;
}

bool TextFile::write(const std::string& data, Error& err) {
    if (!raw_) {
        err.set(ErrorKind::InvalidArgument, "write on closed file " + path_);
        return false;
    }
    if (spec_.binary || isUtf8Name(spec_.encoding)) return raw_->write(data.data(), data.size(), err);
    if (enc_ == kNoConv) {
        err.set(ErrorKind::InvalidArgument, "unknown encoding '" + spec_.encoding + "'");
        return false;
    }
    std::string src = data;
    char* in = &src[0];
    size_t inLeft = src.size();
    std::string encoded;
    std::vector<char> obuf(src.size() * 4 + 16);
    while (inLeft > 0) {
        char* op = obuf.data();
        size_t outLeft = obuf.size();
        size_t rc = iconv(enc_, &in, &inLeft, &op, &outLeft);
        encoded.append(obuf.data(), obuf.size() - outLeft);
        if (rc == static_cast<size_t>(-1) && errno != E2BIG) {
            err.set(ErrorKind::Decode, "cannot encode text as '" + spec_.encoding + "' for " + path_);
            return false;
        }
    }
    return raw_->write(encoded.data(), encoded.size(), err);
}

bool TextFile::close(Error& err) {
    if (!raw_) return true;
    bool ok = raw_->close(err);
    raw_.reset();
    return ok;
}

} // namespace sshutils
