// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/spider/Records.h"

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace pathspider::io {

/// Split one CSV line; double quotes group fields and "" escapes a quote.
std::vector<std::string> split_csv_line(const std::string& line);

/**
 * @brief Streams jobs from CSV rows "address,port[,host[,rank]]".
 *
 * Blank lines are skipped. Any malformed row throws JobFormatError carrying
 * the 1-based line number.
 */
class JobReader {
public:
    explicit JobReader(std::istream& in) : in_(in) {}

    /// Next job, or nullopt at end of input.
    std::optional<spider::Job> next();

    std::size_t line() const noexcept { return line_; }

    static spider::Job parse_row(const std::vector<std::string>& fields, std::size_t line);
    static std::vector<spider::Job> read_all(std::istream& in);

private:
    std::istream& in_;
    std::size_t line_{0};
};

} // namespace pathspider::io
