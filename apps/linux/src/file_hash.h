#pragma once
#include <cstdint>
#include <string>
#include <vector>

std::vector<uint8_t> sha256_bytes(const std::string& data);

// Streams the file through EVP SHA-256; throws TransferError(LocalIo)
// when the file cannot be read.
std::string sha256_file_hex(const std::string& path);

std::string hex_encode(const std::vector<uint8_t>& data);
