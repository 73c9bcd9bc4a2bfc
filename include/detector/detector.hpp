#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

/**
 * @brief Abstract standalone detector
 *
 * A detector inspects one field's decoded text and appends spans for the
 * PII it recognises. Implementations are immutable after construction and
 * are shared by every in-flight request, so match() must be const and
 * thread-safe.
 *
 * Spans are emitted with an empty field_path; the PatternMatcher fills it.
 */
class IDetector {
public:
    virtual ~IDetector() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual std::string_view kind() const = 0;
    [[nodiscard]] virtual PiiType type() const = 0;
    [[nodiscard]] virtual double confidence() const = 0;

    /// Whether this detector runs on a field with the given last object key
    [[nodiscard]] virtual bool applies_to(std::string_view field_key) const = 0;

    virtual void match(std::string_view text, std::vector<Span>& out) const = 0;
};

/**
 * @brief Shared identity and key scoping for concrete detectors
 *
 * field_keys empty = run on every field. Otherwise the field's last object
 * key must equal one of them, ignoring ASCII case.
 */
class DetectorBase : public IDetector {
public:
    DetectorBase(std::string name, PiiType type, double confidence,
                 std::vector<std::string> field_keys);

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] PiiType type() const override { return type_; }
    [[nodiscard]] double confidence() const override { return confidence_; }
    [[nodiscard]] bool applies_to(std::string_view field_key) const override;

    [[nodiscard]] const std::vector<std::string>& field_keys() const noexcept { return field_keys_; }

protected:
    void emit(size_t start, size_t end, std::vector<Span>& out) const;

private:
    std::string name_;
    PiiType type_;
    double confidence_;
    std::vector<std::string> field_keys_;   // lowercased
};

} // namespace piiguard
