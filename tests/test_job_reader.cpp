// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/Errors.h"
#include "pathspider/io/JobReader.h"
#include "pathspider/io/ResultWriter.h"

#include <cassert>
#include <sstream>
#include <string>

using namespace pathspider;
using io::JobReader;

namespace {

// Line number of the JobFormatError thrown while reading @p text, 0 if none.
std::size_t failing_line(const std::string& text) {
    std::istringstream in(text);
    try {
        JobReader::read_all(in);
    } catch (const JobFormatError& ex) {
        return ex.line();
    }
    return 0;
}

} // namespace

int main() {
    // Well-formed input, blank lines and CRLF included.
    {
        std::istringstream in(
            "192.0.2.1,80\n"
            "\n"
            "2001:db8::5,443,example.org,17\r\n"
            "\"198.51.100.3\",8080,\"a, quoted \"\"host\"\"\",\n");
        auto jobs = JobReader::read_all(in);
        assert(jobs.size() == 3);

        assert(jobs[0].address.to_string() == "192.0.2.1");
        assert(jobs[0].port == 80);
        assert(!jobs[0].host);
        assert(!jobs[0].rank);

        assert(jobs[1].address.version == 6);
        assert(jobs[1].port == 443);
        assert(jobs[1].host && *jobs[1].host == "example.org");
        assert(jobs[1].rank && *jobs[1].rank == 17);

        assert(jobs[2].host && *jobs[2].host == "a, quoted \"host\"");
        assert(!jobs[2].rank);
    }

    // Streaming reader keeps track of line numbers.
    {
        std::istringstream in("\n10.0.0.1,22\n");
        JobReader reader(in);
        auto job = reader.next();
        assert(job && job->port == 22);
        assert(reader.line() == 2);
        assert(!reader.next());
    }

    // Malformed rows abort with the offending line.
    assert(failing_line("192.0.2.1,80\nnot-an-ip,80\n") == 2);
    assert(failing_line("192.0.2.1\n") == 1);
    assert(failing_line("192.0.2.1,0\n") == 1);
    assert(failing_line("192.0.2.1,65536\n") == 1);
    assert(failing_line("192.0.2.1,http\n") == 1);
    assert(failing_line("192.0.2.1,80,host,-4\n") == 1);
    assert(failing_line("192.0.2.1,80,host,1,extra\n") == 1);
    assert(failing_line("192.0.2.1,80\n192.0.2.2,81\n") == 0);

    assert((io::split_csv_line("a,,b") == std::vector<std::string>{"a", "", "b"}));

    // Result writer: one JSON object per line until the terminal marker.
    {
        Stream<spider::MergedRecord> merged;
        spider::MergedRecord rec;
        rec.active.remote_ip = *net::IpAddress::parse("192.0.2.1");
        rec.active.remote_port = 80;
        rec.active.local_port = 41000;
        rec.active.config = 1;
        rec.active.state = spider::ConnectionState::Ok;
        rec.active.result = 200;
        rec.features["tfostate"] = "acked";
        merged.push(rec);
        merged.push(rec);
        merged.push(EndOfStream{});

        std::ostringstream out;
        io::ResultWriter writer(out);
        assert(writer.run(merged) == 2);
        assert(writer.observed() == 0);

        std::istringstream lines(out.str());
        std::string line;
        std::size_t count = 0;
        while (std::getline(lines, line)) {
            auto doc = nlohmann::json::parse(line);
            assert(doc.at("dip") == "192.0.2.1");
            assert(doc.at("sp") == 41000);
            assert(doc.at("connstate") == "ok");
            assert(doc.at("observed") == false);
            assert(doc.at("tfostate") == "acked");
            assert(doc.at("host").is_null());
            ++count;
        }
        assert(count == 2);
    }

    return 0;
}
