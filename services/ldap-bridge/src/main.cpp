/**
 * @file main.cpp
 * @brief crowd-ldap-bridge command-line host
 *
 * Drives the Crowd partition the way an LDAP front end would: lookup by DN,
 * search, simple bind and a backend reachability check. Entries are written
 * to stdout as LDIF; errors go to stderr as JSON. The exit status is the
 * LDAP result code of the operation.
 *
 * Usage:
 *   crowd-ldap-bridge lookup <dn> [attr...]
 *   crowd-ldap-bridge search <base> <base|one|sub> <filter> [attr...]
 *   crowd-ldap-bridge bind <dn>          (secret from BIND_PASSWORD or stdin)
 *   crowd-ldap-bridge check
 */

#include "common/ldif_writer.h"
#include "infrastructure/app_config.h"
#include "infrastructure/service_container.h"

#include "crowdldap/crowd/crowd_rest_backend.h"
#include "crowdldap/directory/crowd_partition.h"
#include "crowdldap/directory/filter.h"
#include "error_codes.h"
#include "exceptions.h"
#include "logger.h"

#include <curl/curl.h>
#include <ldap.h>
#include <json/json.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using crowdldap::common::ErrorCode;
using crowdldap::common::ErrorResponse;
using crowdldap::directory::AuthOutcome;
using crowdldap::directory::CrowdPartition;
using crowdldap::directory::Dn;
using crowdldap::directory::EntryCursor;
using crowdldap::directory::SearchStatus;

namespace {

std::atomic<EntryCursor*> activeCursor{nullptr};

void handleInterrupt(int /* signal */) {
    if (EntryCursor* cursor = activeCursor.load()) {
        cursor->abandon();
    }
}

void printUsage() {
    std::cerr << "Usage:\n"
              << "  crowd-ldap-bridge lookup <dn> [attr...]\n"
              << "  crowd-ldap-bridge search <base> <base|one|sub> <filter> [attr...]\n"
              << "  crowd-ldap-bridge bind <dn>\n"
              << "  crowd-ldap-bridge check\n";
}

/**
 * @brief Print an error as JSON and return its LDAP result code
 */
int reportError(ErrorCode code, const std::string& message, const std::string& details = "") {
    ErrorResponse response(code, message, details);
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    std::cerr << Json::writeString(writer, response.toJson()) << std::endl;
    return response.getLdapResultCode();
}

ErrorCode searchStatusToErrorCode(SearchStatus status) {
    switch (status) {
        case SearchStatus::SUCCESS:             return ErrorCode::SUCCESS;
        case SearchStatus::SIZE_LIMIT_EXCEEDED: return ErrorCode::BACKEND_SIZE_LIMIT_EXCEEDED;
        case SearchStatus::BACKEND_UNAVAILABLE: return ErrorCode::BACKEND_UNAVAILABLE;
        case SearchStatus::ABANDONED:           return ErrorCode::DIRECTORY_ABANDONED;
        case SearchStatus::IN_PROGRESS:         break;
    }
    return ErrorCode::SYSTEM_INTERNAL_ERROR;
}

std::vector<std::string> remainingArgs(int argc, char* argv[], int from) {
    std::vector<std::string> args;
    for (int i = from; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

int runLookup(CrowdPartition& partition, const std::string& dnText, const std::vector<std::string>& attributes) {
    auto dn = Dn::parse(dnText);
    if (!dn) {
        return reportError(ErrorCode::DIRECTORY_INVALID_DN, "Invalid DN", dnText);
    }

    auto result = partition.lookup(*dn, attributes);
    if (!result.found()) {
        return reportError(result.code, result.message, dnText);
    }

    crowdldap::common::LdifWriter::writeEntry(std::cout, *result.entry);
    return LDAP_SUCCESS;
}

int runSearch(CrowdPartition& partition, const std::string& baseText, const std::string& scopeText,
              const std::string& filterText, const std::vector<std::string>& attributes) {
    auto base = Dn::parse(baseText);
    if (!base) {
        return reportError(ErrorCode::DIRECTORY_INVALID_DN, "Invalid search base", baseText);
    }

    auto scope = crowdldap::directory::parseSearchScope(scopeText);
    if (!scope) {
        printUsage();
        return LDAP_PARAM_ERROR;
    }

    std::optional<crowdldap::directory::Filter> filter;
    try {
        filter = crowdldap::directory::Filter::parse(filterText);
    } catch (const crowdldap::common::FilterSyntaxException& e) {
        return reportError(ErrorCode::DIRECTORY_INVALID_FILTER, e.what(), filterText);
    }

    auto cursor = partition.search(*base, *scope, *filter, attributes);
    activeCursor.store(cursor.get());

    size_t count = 0;
    crowdldap::directory::Entry entry{Dn(), crowdldap::directory::AttributeMap{}};
    while (cursor->next(entry)) {
        crowdldap::common::LdifWriter::writeEntry(std::cout, entry);
        ++count;
    }
    activeCursor.store(nullptr);

    ErrorCode code = searchStatusToErrorCode(cursor->status());
    int resultCode = crowdldap::common::errorCodeToLdapResult(code);
    std::cout << "# result: " << resultCode << " " << crowdldap::common::ldapResultToString(resultCode) << "\n"
              << "# numEntries: " << count << std::endl;
    spdlog::info("search {} {} {}: {} entries, {}", baseText, scopeText, filter->toString(), count,
                 crowdldap::directory::searchStatusToString(cursor->status()));

    if (code != ErrorCode::SUCCESS) {
        return reportError(code, cursor->message());
    }
    return LDAP_SUCCESS;
}

int runBind(CrowdPartition& partition, const std::string& bindDn) {
    std::string secret;
    if (const char* env = std::getenv("BIND_PASSWORD")) {
        secret = env;
    } else {
        std::getline(std::cin, secret);
    }

    AuthOutcome outcome = partition.authenticate({bindDn, secret});
    switch (outcome) {
        case AuthOutcome::ACCEPTED:
            std::cout << "bind accepted: " << bindDn << std::endl;
            return LDAP_SUCCESS;
        case AuthOutcome::REJECTED:
            return reportError(ErrorCode::AUTH_INVALID_CREDENTIALS, "Invalid credentials", bindDn);
        case AuthOutcome::UNAVAILABLE:
            break;
    }
    return reportError(ErrorCode::AUTH_UNAVAILABLE, "Authentication service unavailable", bindDn);
}

int runCheck(crowdldap::crowd::CrowdRestBackend& backend) {
    auto status = backend.testConnection();
    if (status != crowdldap::directory::BackendStatus::OK) {
        return reportError(ErrorCode::BACKEND_UNAVAILABLE, "Crowd connection test failed",
                           crowdldap::directory::backendStatusToString(status));
    }
    std::cout << "Crowd connection OK" << std::endl;
    return LDAP_SUCCESS;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return LDAP_PARAM_ERROR;
    }
    const std::string command = argv[1];

    crowdldap::infrastructure::AppConfig config;
    try {
        config = crowdldap::infrastructure::AppConfig::fromEnvironment();
    } catch (const crowdldap::common::ConfigException& e) {
        return reportError(ErrorCode::CONFIG_INVALID, e.what());
    }

    crowdldap::common::Logger::initialize("crowd-ldap-bridge", config.logLevel,
                                          !config.logFile.empty(), config.logFile);

    try {
        config.validateRequiredCredentials();
    } catch (const crowdldap::common::ConfigException& e) {
        spdlog::error("{}", e.what());
        return reportError(ErrorCode::CONFIG_INVALID, e.what());
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        return reportError(ErrorCode::SYSTEM_INTERNAL_ERROR, "curl_global_init failed");
    }

    int rc = LDAP_PARAM_ERROR;
    {
        crowdldap::infrastructure::ServiceContainer container;
        if (!container.initialize(config)) {
            curl_global_cleanup();
            return reportError(ErrorCode::CONFIG_INVALID, "Initialization failed (see log)");
        }

        std::signal(SIGINT, handleInterrupt);

        CrowdPartition& partition = *container.partition();
        if (command == "lookup" && argc >= 3) {
            rc = runLookup(partition, argv[2], remainingArgs(argc, argv, 3));
        } else if (command == "search" && argc >= 5) {
            rc = runSearch(partition, argv[2], argv[3], argv[4], remainingArgs(argc, argv, 5));
        } else if (command == "bind" && argc == 3) {
            rc = runBind(partition, argv[2]);
        } else if (command == "check") {
            rc = runCheck(*container.backend());
        } else {
            printUsage();
        }
    }

    crowdldap::common::Logger::flush();
    curl_global_cleanup();
    return rc;
}
