// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef PULSAR_TESTS_SEQUENCE_RANDOM_SOURCE_H
#define PULSAR_TESTS_SEQUENCE_RANDOM_SOURCE_H

#include "../../src/core/generator/RandomSource.h"
#include <cstdint>
#include <vector>

namespace Pulsar::Testing {

/**
 * @brief Deterministic random source replaying a fixed sequence
 *
 * Values are handed out in order and wrap around when exhausted.
 * An empty sequence yields 0, 1, 2, ...
 */
class SequenceRandomSource final : public IRandomSource {
public:
    SequenceRandomSource() = default;
    explicit SequenceRandomSource(std::vector<uint32_t> values) : m_values(std::move(values)) {}

    GeneratorResult<void> fill(std::span<uint32_t> out) override {
        ++m_calls;
        if (m_fail) {
            return std::unexpected(GeneratorError::RandomSourceFailed);
        }
        for (auto& value : out) {
            value = m_values.empty() ? static_cast<uint32_t>(m_next)
                                     : m_values[m_next % m_values.size()];
            ++m_next;
        }
        return {};
    }

    void set_fail(bool fail) { m_fail = fail; }
    [[nodiscard]] int calls() const { return m_calls; }

private:
    std::vector<uint32_t> m_values;
    size_t m_next = 0;
    int m_calls = 0;
    bool m_fail = false;
};

} // namespace Pulsar::Testing

#endif // PULSAR_TESTS_SEQUENCE_RANDOM_SOURCE_H
