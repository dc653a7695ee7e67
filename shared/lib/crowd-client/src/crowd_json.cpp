/**
 * @file crowd_json.cpp
 * @brief Crowd REST JSON conversion
 */

#include "crowdldap/crowd/crowd_json.h"

#include <sstream>

namespace crowdldap::crowd {

namespace {

void setIfPresent(const Json::Value& json, const char* field,
                  const char* attribute, directory::AttributeMap& out) {
    if (!json.isMember(field) || !json[field].isString()) return;
    std::string value = json[field].asString();
    if (!value.empty()) {
        out[attribute] = {value};
    }
}

/// {"attributes": {"attributes": [{"name": n, "values": [...]}]}}
void copyCustomAttributes(const Json::Value& json, directory::AttributeMap& out) {
    if (!json.isMember("attributes")) return;
    const Json::Value& wrapper = json["attributes"];
    const Json::Value& list = wrapper.isObject() ? wrapper["attributes"] : wrapper;
    if (!list.isArray()) return;

    for (const auto& attr : list) {
        if (!attr.isObject() || !attr["name"].isString()) continue;
        std::string name = attr["name"].asString();
        if (name.empty()) continue;

        std::vector<std::string> values;
        for (const auto& v : attr["values"]) {
            if (v.isString() && !v.asString().empty()) {
                values.push_back(v.asString());
            }
        }
        if (!values.empty()) {
            out[name] = std::move(values);
        }
    }
}

std::string nameOf(const Json::Value& json) {
    if (json.isObject() && json["name"].isString()) {
        return json["name"].asString();
    }
    return "";
}

} // anonymous namespace

std::optional<Json::Value> parseJson(const std::string& body) {
    Json::CharReaderBuilder reader;
    std::istringstream iss(body);
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(reader, iss, &root, &errs)) {
        return std::nullopt;
    }
    return root;
}

directory::Identity userFromJson(const Json::Value& json) {
    directory::Identity identity;
    if (!json.isObject()) return identity;
    identity.name = nameOf(json);

    // Custom attributes first so the standard fields win on collisions
    copyCustomAttributes(json, identity.attributes);
    setIfPresent(json, "name", "cn", identity.attributes);
    setIfPresent(json, "first-name", "givenName", identity.attributes);
    setIfPresent(json, "last-name", "sn", identity.attributes);
    setIfPresent(json, "display-name", "displayName", identity.attributes);
    setIfPresent(json, "email", "mail", identity.attributes);
    return identity;
}

directory::Group groupFromJson(const Json::Value& json) {
    directory::Group group;
    if (!json.isObject()) return group;
    group.name = nameOf(json);

    copyCustomAttributes(json, group.attributes);
    setIfPresent(json, "description", "description", group.attributes);
    return group;
}

std::vector<directory::Identity> usersFromJson(const Json::Value& json) {
    std::vector<directory::Identity> users;
    if (!json.isObject() || !json["users"].isArray()) return users;
    for (const auto& u : json["users"]) {
        auto identity = userFromJson(u);
        if (!identity.name.empty()) users.push_back(std::move(identity));
    }
    return users;
}

std::vector<directory::Group> groupsFromJson(const Json::Value& json) {
    std::vector<directory::Group> groups;
    if (!json.isObject() || !json["groups"].isArray()) return groups;
    for (const auto& g : json["groups"]) {
        auto group = groupFromJson(g);
        if (!group.name.empty()) groups.push_back(std::move(group));
    }
    return groups;
}

std::vector<std::string> namesFromJson(const Json::Value& json, const std::string& listKey) {
    std::vector<std::string> names;
    if (!json.isObject() || !json[listKey].isArray()) return names;
    for (const auto& item : json[listKey]) {
        std::string name = nameOf(item);
        if (!name.empty()) names.push_back(std::move(name));
    }
    return names;
}

directory::CredentialStatus credentialStatusFromError(const Json::Value& json) {
    std::string reason = (json.isObject() && json["reason"].isString()) ? json["reason"].asString() : "";
    if (reason == "USER_NOT_FOUND") {
        return directory::CredentialStatus::UNKNOWN_USER;
    }
    if (reason == "INACTIVE_ACCOUNT" || reason == "EXPIRED_CREDENTIAL") {
        return directory::CredentialStatus::ACCOUNT_DISABLED;
    }
    return directory::CredentialStatus::INVALID_CREDENTIALS;
}

bool isActive(const Json::Value& json) {
    if (json.isObject() && json.isMember("active") && json["active"].isBool()) {
        return json["active"].asBool();
    }
    return true;
}

std::string passwordBody(const std::string& secret) {
    Json::Value body;
    body["value"] = secret;
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, body);
}

} // namespace crowdldap::crowd
