#ifndef LECTERN_SHA256_H
#define LECTERN_SHA256_H

#include <string>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <cstring>

namespace lectern::crypto {

    class SHA256 {
    public:
        SHA256() { reset(); }

        void update(const void* data, size_t len) {
            const uint8_t* current = static_cast<const uint8_t*>(data);
            for (size_t i = 0; i < len; ++i) {
                m_data[m_datalen++] = current[i];
                if (m_datalen == 64) {
                    transform();
                    m_bitlen += 512;
                    m_datalen = 0;
                }
            }
        }

        void update(const std::string& text) { update(text.data(), text.size()); }

        /**
         * @brief Finishes the digest and returns it as 64 lowercase hex characters.
         * The object is reset afterwards and can be reused.
         */
        std::string final() {
            uint32_t i = m_datalen;

            if (m_datalen < 56) {
                m_data[i++] = 0x80;
                while (i < 56) m_data[i++] = 0x00;
            } else {
                m_data[i++] = 0x80;
                while (i < 64) m_data[i++] = 0x00;
                transform();
                memset(m_data, 0, 56);
            }

            m_bitlen += static_cast<uint64_t>(m_datalen) * 8;
            for (int b = 0; b < 8; ++b) {
                m_data[63 - b] = static_cast<uint8_t>(m_bitlen >> (8 * b));
            }
            transform();

            std::stringstream ss;
            for (uint32_t word : m_state) {
                ss << std::hex << std::setw(8) << std::setfill('0') << word;
            }
            reset();
            return ss.str();
        }

        static std::string hash_string(const std::string& text) {
            SHA256 sha;
            sha.update(text);
            return sha.final();
        }

        /**
         * @brief Hashes a file in 64 KiB reads.
         * @return The hex digest, or an empty string if the file cannot be opened or read.
         */
        static std::string hash_file(const std::string& path) {
            std::ifstream file(path, std::ios::binary);
            if (!file) return "";

            SHA256 sha;
            char buffer[65536];
            while (file.read(buffer, sizeof(buffer))) {
                sha.update(buffer, static_cast<size_t>(file.gcount()));
            }
            if (file.bad()) return "";
            if (file.gcount() > 0) {
                sha.update(buffer, static_cast<size_t>(file.gcount()));
            }
            return sha.final();
        }

    private:
        uint32_t m_state[8];
        uint8_t m_data[64];
        uint32_t m_datalen;
        uint64_t m_bitlen;

        static constexpr uint32_t k[64] = {
            0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
            0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
            0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
            0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
            0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
            0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
            0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
            0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
        };

        void reset() {
            m_state[0] = 0x6a09e667;
            m_state[1] = 0xbb67ae85;
            m_state[2] = 0x3c6ef372;
            m_state[3] = 0xa54ff53a;
            m_state[4] = 0x510e527f;
            m_state[5] = 0x9b05688c;
            m_state[6] = 0x1f83d9ab;
            m_state[7] = 0x5be0cd19;
            m_datalen = 0;
            m_bitlen = 0;
            memset(m_data, 0, 64);
        }

        void transform() {
            uint32_t maj, ch, t1, t2, a, b, c, d, e, f, g, h;
            uint32_t m[64];

            for (uint32_t i = 0, j = 0; i < 16; ++i, j += 4) {
                m[i] = (static_cast<uint32_t>(m_data[j]) << 24) | (static_cast<uint32_t>(m_data[j + 1]) << 16) |
                       (static_cast<uint32_t>(m_data[j + 2]) << 8) | static_cast<uint32_t>(m_data[j + 3]);
            }
            for (uint32_t i = 16; i < 64; ++i) {
                m[i] = sig1(m[i - 2]) + m[i - 7] + sig0(m[i - 15]) + m[i - 16];
            }

            a = m_state[0]; b = m_state[1]; c = m_state[2]; d = m_state[3];
            e = m_state[4]; f = m_state[5]; g = m_state[6]; h = m_state[7];

            for (uint32_t i = 0; i < 64; ++i) {
                maj = (a & b) ^ (a & c) ^ (b & c);
                ch = (e & f) ^ ((~e) & g);
                t1 = h + ep1(e) + ch + k[i] + m[i];
                t2 = ep0(a) + maj;
                h = g; g = f; f = e; e = d + t1;
                d = c; c = b; b = a; a = t1 + t2;
            }

            m_state[0] += a; m_state[1] += b; m_state[2] += c; m_state[3] += d;
            m_state[4] += e; m_state[5] += f; m_state[6] += g; m_state[7] += h;
        }

        static uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }
        static uint32_t sig0(uint32_t x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
        static uint32_t sig1(uint32_t x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }
        static uint32_t ep0(uint32_t x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
        static uint32_t ep1(uint32_t x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }
    };
}
#endif
