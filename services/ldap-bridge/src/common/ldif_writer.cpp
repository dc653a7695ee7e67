/**
 * @file ldif_writer.cpp
 * @brief LDIF formatting
 */

#include "common/ldif_writer.h"

#include "crowdldap/utils/string_utils.h"

#include <algorithm>

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

namespace crowdldap::common {

std::string LdifWriter::base64Encode(const std::string& data) {
    if (data.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, mem);

    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(b64, data.data(), static_cast<int>(data.size()));
    BIO_flush(b64);

    BUF_MEM* bufferPtr;
    BIO_get_mem_ptr(b64, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(b64);

    return result;
}

std::string LdifWriter::formatAttribute(const std::string& name, const std::string& value) {
    if (utils::isLdifSafe(value)) {
        return foldLine(name + ": " + value);
    }
    return foldLine(name + ":: " + base64Encode(value));
}

std::string LdifWriter::foldLine(const std::string& line) {
    if (line.size() <= kLineWidth) {
        return line + "\n";
    }

    std::string result = line.substr(0, kLineWidth) + "\n";
    size_t pos = kLineWidth;
    while (pos < line.size()) {
        size_t chunk = std::min(kLineWidth - 1, line.size() - pos);
        result += " " + line.substr(pos, chunk) + "\n";
        pos += chunk;
    }
    return result;
}

std::string LdifWriter::formatEntry(const directory::Entry& entry) {
    std::string out = formatAttribute("dn", entry.dn().toString());

    if (const auto* classes = entry.get("objectClass")) {
        for (const auto& value : *classes) {
            out += formatAttribute("objectClass", value);
        }
    }

    for (const auto& [name, values] : entry.attributes()) {
        if (utils::equalsIgnoreCase(name, "objectClass")) continue;
        for (const auto& value : values) {
            out += formatAttribute(name, value);
        }
    }

    out += "\n";
    return out;
}

} // namespace crowdldap::common
