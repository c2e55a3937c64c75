#include "errors.hpp"

namespace ACC{

    IOError::IOError(const std::string& path, const std::string& reason)
        : PipelineError(path + ": " + reason), path_(path) {}

    FormatError::FormatError(const std::string& file, std::size_t line, const std::string& reason)
        : PipelineError(file + ":" + std::to_string(line) + ": " + reason),
          file_(file), line_(line) {}

    AlignmentError::AlignmentError(const std::string& referenceFile, std::size_t expected,
                                   const std::string& offendingFile, std::size_t actual)
        : PipelineError(offendingFile + " has " + std::to_string(actual) + " samples, expected "
                        + std::to_string(expected) + " (as in " + referenceFile + ")"),
          reference_file_(referenceFile), offending_file_(offendingFile),
          expected_(expected), actual_(actual) {}
}
