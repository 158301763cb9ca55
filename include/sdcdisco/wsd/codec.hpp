/**
 * @file codec.hpp
 * @brief SOAP 1.2 encoding and decoding of discovery envelopes.
 *
 * Encoding is total for the six discovery actions. Decoding never
 * throws: anything that is not a well-formed discovery message yields
 * std::nullopt and a warning in the log.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#include "sdcdisco/wsd/export.hpp"
#include "sdcdisco/wsd/types.hpp"

#include <optional>
#include <string>

namespace sdcdisco {
namespace wsd {

/**
 * @brief Serialize an envelope to UTF-8 XML.
 *
 * A Scopes element has a single MatchBy attribute, taken from the first scope of the list.
 * All scopes of one element must therefore share one dialect; other dialects are sent
 * under the first one (and a warning is logged).
 *
 * @throws UnsupportedActionError if env.action is not a discovery action.
 */
SDCDISCO_WSD_API std::string encodeEnvelope(const Envelope& env);

/**
 * @brief Parse a datagram or HTTP body.
 * @param data Raw bytes.
 * @param source Peer description used in log lines.
 */
SDCDISCO_WSD_API std::optional<Envelope> decodeEnvelope(const std::string& data,
                                                        const std::string& source);

}  // namespace wsd
}  // namespace sdcdisco
