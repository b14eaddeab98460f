#include "job_source.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

Result<std::string> FileJobInfoSource::fetch() {
    if (path_ == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        if (std::cin.bad()) {
            return Result<std::string>::Err(ErrorKind::Upstream, "failed to read stdin");
        }
        return Result<std::string>::Ok(ss.str());
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        gestat_log(fmt::format("source: cannot open {}", path_.string()));
        return Result<std::string>::Err(ErrorKind::Upstream,
            fmt::format("cannot open {}", path_.string()));
    }

    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result<std::string>::Err(ErrorKind::Upstream,
            fmt::format("failed reading {}", path_.string()));
    }
    return Result<std::string>::Ok(std::move(data));
}

std::string FileJobInfoSource::describe() const {
    return path_ == "-" ? "<stdin>" : path_.string();
}
