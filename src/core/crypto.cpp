#include "crypto.hpp"
#include <cctype>
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace tally {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string TallyCrypto::generate_sha256(const std::string& str) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> context(EVP_MD_CTX_new());
    if (!context ||
        EVP_DigestInit_ex(context.get(), EVP_sha256(), NULL) != 1 ||
        EVP_DigestUpdate(context.get(), str.data(), str.size()) != 1 ||
        EVP_DigestFinal_ex(context.get(), hash, &length) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

std::string TallyCrypto::normalize_description(const std::string& description) {
    std::string out;
    out.reserve(description.size());
    bool pending_space = false;
    for (unsigned char c : description) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        if (c < 0x80) {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string TallyCrypto::calculate_fingerprint(int64_t account_id, const Date& posted,
                                               money_micro amount, const std::string& description) {
    std::stringstream data;
    data << account_id << '|'
         << posted.to_iso() << '|'
         << amount << '|'
         << normalize_description(description);

    return generate_sha256(data.str());
}

} // namespace tally
