// SPDX-License-Identifier: BSD-2-Clause

#include "pathspider/io/ResultWriter.h"

#include "pathspider/log/Log.h"

namespace pathspider::io {

void ResultWriter::write(const spider::MergedRecord& rec) {
    out_ << rec.to_json().dump() << '\n';
    out_.flush();
    ++written_;
    if (rec.observed()) ++observed_;
}

uint64_t ResultWriter::run(Stream<spider::MergedRecord>& input) {
    for (;;) {
        auto item = input.pop();
        if (is_end_of_stream(item)) break;
        write(std::get<spider::MergedRecord>(item));
    }
    if (!out_) {
        PSLOG_ERROR("Result output stream went bad after %llu records",
                    static_cast<unsigned long long>(written_));
    }
    return written_;
}

} // namespace pathspider::io
