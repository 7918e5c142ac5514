// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pathspider/spider/Records.h"
#include "pathspider/util/BlockingQueue.h"

#include <cstdint>
#include <ostream>

namespace pathspider::io {

/**
 * @brief Writes each merged record as one JSON object per line until EndOfStream.
 */
class ResultWriter {
public:
    explicit ResultWriter(std::ostream& out) : out_(out) {}

    void write(const spider::MergedRecord& rec);

    /// Drain @p input until its terminal marker; returns the number of records written.
    uint64_t run(Stream<spider::MergedRecord>& input);

    uint64_t written() const noexcept { return written_; }
    uint64_t observed() const noexcept { return observed_; }

private:
    std::ostream& out_;
    uint64_t written_{0};
    uint64_t observed_{0};
};

} // namespace pathspider::io
