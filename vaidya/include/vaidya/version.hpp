#pragma once

#define VAIDYA_VERSION "1.4.0"
#define VAIDYA_CLIENT_NAME "vaidya"

// MCP protocol revision sent in the initialize handshake
#define VAIDYA_MCP_PROTOCOL_VERSION "2024-11-05"
