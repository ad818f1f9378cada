#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{
// Well-known rendezvous port of the conversion server
inline constexpr std::uint16_t SERVER_PORT = 5051;
inline constexpr std::string_view SERVER_HOST = "127.0.0.1";
inline constexpr std::string_view BIND_HOST   = "0.0.0.0";

// Retry policy defaults
inline constexpr std::uint32_t ACK_TIMEOUT_MS  = 2000;
inline constexpr std::uint32_t MAX_RETRIES     = 5;
inline constexpr std::uint32_t IDLE_TIMEOUT_MS = 30000;

// Output directories (relative to CWD)
inline constexpr std::string_view CLIENT_OUTPUT_DIR = "results_client";
inline constexpr std::string_view SERVER_OUTPUT_DIR = "conversions_server";

// Reject uploads larger than this before any packet is sent
inline constexpr std::size_t MAX_FILE_BYTES = 64u * 1024u * 1024u;

}  // namespace constants
