#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

// Hands the decoder a raw `qstat -xml` document. Running qstat itself is
// left to whoever produces the snapshot; failures here are Upstream errors.
class JobInfoSource {
public:
    virtual ~JobInfoSource() = default;
    virtual Result<std::string> fetch() = 0;
    virtual std::string describe() const = 0;
};

// Reads a snapshot file; "-" reads stdin.
class FileJobInfoSource : public JobInfoSource {
public:
    explicit FileJobInfoSource(std::filesystem::path path) : path_(std::move(path)) {}

    Result<std::string> fetch() override;
    std::string describe() const override;

private:
    std::filesystem::path path_;
};

// Serves an in-memory document.
class StringJobInfoSource : public JobInfoSource {
public:
    explicit StringJobInfoSource(std::string xml) : xml_(std::move(xml)) {}

    Result<std::string> fetch() override { return Result<std::string>::Ok(xml_); }
    std::string describe() const override { return "<memory>"; }

private:
    std::string xml_;
};
