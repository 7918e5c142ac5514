// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/io/JobReader.h"

#include "pathspider/Errors.h"

#include <cctype>

namespace pathspider::io {

namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

bool all_digits(const std::string& text) {
    if (text.empty()) return false;
    for (char ch : text) {
        if (ch < '0' || ch > '9') return false;
    }
    return true;
}

} // namespace

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quoted) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current.push_back(ch);
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else if (ch != '\r') {
            current.push_back(ch);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

spider::Job JobReader::parse_row(const std::vector<std::string>& fields, std::size_t line) {
    if (fields.size() < 2) {
        throw JobFormatError(line, "expected at least address and port");
    }
    if (fields.size() > 4) {
        throw JobFormatError(line, "too many fields");
    }

    spider::Job job;
    const auto addr_text = trim(fields[0]);
    auto addr = net::IpAddress::parse(addr_text);
    if (!addr) {
        throw JobFormatError(line, "invalid address '" + addr_text + "'");
    }
    job.address = *addr;

    const auto port_text = trim(fields[1]);
    if (!all_digits(port_text) || port_text.size() > 5) {
        throw JobFormatError(line, "invalid port '" + port_text + "'");
    }
    const unsigned long port = std::stoul(port_text);
    if (port == 0 || port > 65535) {
        throw JobFormatError(line, "port out of range '" + port_text + "'");
    }
    job.port = static_cast<uint16_t>(port);

    if (fields.size() >= 3) {
        auto host = trim(fields[2]);
        if (!host.empty()) job.host = std::move(host);
    }
    if (fields.size() == 4) {
        const auto rank_text = trim(fields[3]);
        if (!rank_text.empty()) {
            if (!all_digits(rank_text) || rank_text.size() > 18) {
                throw JobFormatError(line, "invalid rank '" + rank_text + "'");
            }
            job.rank = std::stol(rank_text);
        }
    }
    return job;
}

std::optional<spider::Job> JobReader::next() {
    std::string raw;
    while (std::getline(in_, raw)) {
        ++line_;
        if (trim(raw).empty()) continue;
        return parse_row(split_csv_line(raw), line_);
    }
    return std::nullopt;
}

std::vector<spider::Job> JobReader::read_all(std::istream& in) {
    JobReader reader(in);
    std::vector<spider::Job> jobs;
    while (auto job = reader.next()) {
        jobs.push_back(std::move(*job));
    }
    return jobs;
}

} // namespace pathspider::io
