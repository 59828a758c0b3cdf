/**
 * @file transform.h
 * @brief Plain <-> wrapped value encoding
 *
 * Some agent hosts box every scalar as {"type": "text", "text": <value>}.
 * The transformer rewrites incoming params and outgoing results between that
 * wrapped encoding and plain JSON, each direction configured independently.
 */

#pragma once

#include "toolrpc/common.h"
#include <string>

namespace toolrpc {

enum class Format {
    PLAIN,
    WRAPPED
};

const char* to_string(Format format);

/**
 * @brief Parse "plain"/"standard" or "wrapped"/"bedrock" (case-insensitive)
 * @throws std::invalid_argument for anything else
 */
Format format_from_string(const std::string& s);

/**
 * @brief Decode-side (params) and encode-side (result) formats
 */
struct FormatConfig {
    Format decode = Format::PLAIN;
    Format encode = Format::PLAIN;

    static FormatConfig plain() { return {Format::PLAIN, Format::PLAIN}; }
    static FormatConfig wrapped() { return {Format::WRAPPED, Format::WRAPPED}; }
    static FormatConfig plain_to_wrapped() { return {Format::PLAIN, Format::WRAPPED}; }
    static FormatConfig wrapped_to_plain() { return {Format::WRAPPED, Format::PLAIN}; }

    bool operator==(const FormatConfig& other) const {
        return decode == other.decode && encode == other.encode;
    }
    bool operator!=(const FormatConfig& other) const { return !(*this == other); }
};

/**
 * @brief True for any object holding both a "type" and a "text" key
 *
 * Structural only: the value of "type" is not inspected.
 */
bool is_wrapper(const json& value);

/**
 * @brief Box every leaf as {"type": "text", "text": leaf}
 *
 * Objects and arrays are rebuilt member-wise, never boxed themselves.
 * A value that already satisfies is_wrapper() is returned unchanged, which
 * also applies to tool data that merely happens to have that shape.
 */
json wrap(const json& value);

/**
 * @brief Collapse {"type": "text", "text": inner} into unwrap(inner)
 *
 * Only a string "type" equal to "text" is collapsed; other objects and
 * arrays are rebuilt member-wise and leaves are returned as-is.
 */
json unwrap(const json& value);

/**
 * @brief Applies a FormatConfig to params and results
 *
 * Stateless apart from its configuration; safe to share across threads.
 */
class FormatTransformer {
public:
    FormatTransformer() = default;
    explicit FormatTransformer(FormatConfig config) : config_(config) {}

    const FormatConfig& config() const { return config_; }

    /**
     * @brief Decode side: unwrap params when the decode format is WRAPPED
     */
    json transform_params(const json& params) const;

    /**
     * @brief Encode side: wrap the result when the encode format is WRAPPED
     */
    json transform_result(const json& result) const;

private:
    FormatConfig config_;
};

} // namespace toolrpc
