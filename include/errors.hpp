#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ACC{

    // Base for every failure the preprocessing pipeline reports.
    class PipelineError : public std::runtime_error {
    public:
        explicit PipelineError(const std::string& what) : std::runtime_error(what) {}
    };

    // Missing/unreadable file or directory, or no trial file found.
    class IOError : public PipelineError {
    public:
        IOError(const std::string& path, const std::string& reason);
        const std::string& path() const { return path_; }
    private:
        std::string path_;
    };

    // A record that is not exactly three integers.
    class FormatError : public PipelineError {
    public:
        FormatError(const std::string& file, std::size_t line, const std::string& reason);
        const std::string& file() const { return file_; }
        std::size_t line() const { return line_; }
    private:
        std::string file_;
        std::size_t line_;
    };

    // Trials of one batch with different sample counts.
    class AlignmentError : public PipelineError {
    public:
        AlignmentError(const std::string& referenceFile, std::size_t expected,
                       const std::string& offendingFile, std::size_t actual);
        const std::string& referenceFile() const { return reference_file_; }
        const std::string& offendingFile() const { return offending_file_; }
        std::size_t expected() const { return expected_; }
        std::size_t actual() const { return actual_; }
    private:
        std::string reference_file_;
        std::string offending_file_;
        std::size_t expected_;
        std::size_t actual_;
    };

    // Invalid filter window or configuration value.
    class ConfigError : public PipelineError {
    public:
        explicit ConfigError(const std::string& what) : PipelineError(what) {}
    };
}
