#include "SessionStore.hpp"
#include "time_util.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

void to_json(json& j, const User& u) {
    j = json{
        {"id", u.id},
        {"email", u.email},
        {"full_name", u.full_name},
        {"created_at", u.created_at},
    };
}

void from_json(const json& j, User& u) {
    j.at("id").get_to(u.id);
    j.at("email").get_to(u.email);
    j.at("full_name").get_to(u.full_name);
    u.created_at = j.value("created_at", std::string{});
}

namespace {
    // Whole document, or an empty object when the file does not exist
    json read_document(const std::string& path) {
        std::ifstream in(path);
        if (!in.is_open()) {
            return json::object();
        }
        json doc = json::parse(in);
        if (!doc.is_object()) {
            throw std::runtime_error("session file is not a JSON object");
        }
        return doc;
    }

    // temp file + rename so a crash never leaves a half-written session
    void write_document(const std::string& path, const json& doc) {
        namespace fs = std::filesystem;
        const fs::path target(path);
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path());
        }
        const fs::path tmp = target.string() + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                throw std::runtime_error("cannot open session file for writing: " + tmp.string());
            }
            out << doc.dump(2);
            if (!out) {
                throw std::runtime_error("failed writing session file: " + tmp.string());
            }
        }
        fs::rename(tmp, target);
    }
}

SessionStore::SessionStore(const std::string& filePath)
    : m_filePath(filePath)
{
    if (m_filePath.empty()) {
        throw std::invalid_argument("SessionStore: file path must not be empty");
    }
}

void SessionStore::createSession(const User& user) {
    json doc;
    try {
        doc = read_document(m_filePath);
    } catch (const std::exception& ex) {
        // Unreadable document is replaced wholesale
        std::cerr << "[Session] discarding unreadable " << m_filePath << ": " << ex.what() << "\n";
        doc = json::object();
    }

    doc[kSessionKey] = json{
        {"user", user},
        {"timestamp", now_utc_iso8601()},
    };
    write_document(m_filePath, doc);
}

std::optional<User> SessionStore::getCurrentUser() const {
    try {
        const json doc = read_document(m_filePath);
        auto it = doc.find(kSessionKey);
        if (it == doc.end()) {
            return std::nullopt;
        }
        return it->at("user").get<User>();
    } catch (const json::exception& ex) {
        std::cerr << "[Session] corrupt session record: " << ex.what() << "\n";
    } catch (const std::runtime_error& ex) {
        std::cerr << "[Session] unreadable session file: " << ex.what() << "\n";
    }
    return std::nullopt;
}

void SessionStore::clearSession() {
    namespace fs = std::filesystem;
    json doc;
    try {
        doc = read_document(m_filePath);
    } catch (const std::exception& ex) {
        std::cerr << "[Session] removing unreadable " << m_filePath << ": " << ex.what() << "\n";
        std::error_code ec;
        fs::remove(m_filePath, ec);
        if (ec) throw fs::filesystem_error("remove session file", m_filePath, ec);
        return;
    }

    if (doc.erase(kSessionKey) == 0) {
        return;
    }
    if (doc.empty()) {
        std::error_code ec;
        fs::remove(m_filePath, ec);
        if (ec) throw fs::filesystem_error("remove session file", m_filePath, ec);
    } else {
        write_document(m_filePath, doc);
    }
}
