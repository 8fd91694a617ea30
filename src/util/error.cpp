#include <relpack/error.hpp>

namespace relpack {

const char* RelpackError::code_name(Code c) {
    switch (c) {
        case IO:                    return "IO";
        case Parse:                 return "Parse";
        case Config:                return "Config";
        case NotFound:              return "NotFound";
        case InvalidArg:            return "InvalidArg";
        case Checksum:              return "Checksum";
        case Timeout:               return "Timeout";
        case InvalidVersionFormat:  return "InvalidVersionFormat";
        case MissingInputDirectory: return "MissingInputDirectory";
        case ArchiveWrite:          return "ArchiveWriteFailure";
        case ArchiveExtract:        return "ArchiveExtractFailure";
        case ArchiveRewrite:        return "ArchiveRewriteFailure";
        case RecordValidation:      return "RecordValidationError";
        case MissingRecords:        return "MissingRecordsError";
        case ExternalTool:          return "ExternalToolFailure";
    }
    return "Unknown";
}

RelpackError RelpackError::with_context(const std::string& context) const {
    RelpackError copy = *this;
    copy.message = context + ": " + message;
    return copy;
}

std::string RelpackError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace relpack
