#include <gtest/gtest.h>

#include <iomanip>
#include <sstream>

#include "sha3hasherimpl.hpp"

using namespace ::testing;
using namespace ::ferry::crypto;

namespace
{
class SHA3HasherTest : public Test
{
protected:
    static std::string bytes_to_hex(const std::vector<uint8_t> &bytes)
    {
        std::ostringstream ss;
        ss << std::hex;
        for (uint8_t byte : bytes)
        {
            ss << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
        }
        return ss.str();
    }

    const std::string str_ = "Society does not consist of individuals, but expresses the sum of "
                             "interrelations, the relations within which these individuals stand.";
    const uint8_t *   str_data_ = reinterpret_cast<const uint8_t *>(str_.data());
};
}  // namespace

TEST_F(SHA3HasherTest, HashBuffer)
{
    SHA3HasherImpl sha3;
    std::string    hash = bytes_to_hex(sha3.hash_256(str_data_, str_.size()));
    EXPECT_EQ(hash, "d72d9df35d377e7191339ffca71beefa2604d0ab1d56972e1540bd5886d7f0e3");
}

TEST_F(SHA3HasherTest, HashStream)
{
    SHA3HasherImpl     sha3;
    std::istringstream ss {str_};
    std::string        hash = bytes_to_hex(sha3.hash_256(ss));
    EXPECT_EQ(hash, "d72d9df35d377e7191339ffca71beefa2604d0ab1d56972e1540bd5886d7f0e3");
}

TEST_F(SHA3HasherTest, HashEmptyBuffer)
{
    SHA3HasherImpl sha3;
    std::string    hash = bytes_to_hex(sha3.hash_256(str_data_, 0));
    EXPECT_EQ(hash, "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}
