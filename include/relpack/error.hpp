#pragma once

#include <string>

namespace relpack {

struct RelpackError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg,
        Checksum,
        Timeout,
        InvalidVersionFormat,
        MissingInputDirectory,
        ArchiveWrite,
        ArchiveExtract,
        ArchiveRewrite,
        RecordValidation,
        MissingRecords,
        ExternalTool
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    RelpackError() = default;
    RelpackError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    RelpackError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    RelpackError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Copy of this error with `context: ` prepended to the message
    RelpackError with_context(const std::string& context) const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace relpack
