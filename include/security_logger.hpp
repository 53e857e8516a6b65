#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <cctype>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace edgegate {

// Logs gateway events using blinded peer identifiers (salted hash).
class SecurityLogger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };
    
    enum class EventType {
        AUTH_SUCCESS,
        AUTH_FAILURE,
        RATE_LIMIT_HIT,
        INVALID_INPUT,
        ORIGIN_REJECTED,
        CONNECTION_REJECTED,
        CONNECTION_OPENED,
        CONNECTION_CLOSED,
        DEPENDENCY_FAILURE,
        INTERNAL_ERROR,
        LIFECYCLE
    };
    
    /**
     * Records a gateway event with blinded identifiers.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param remote_addr The source address or session key (blinded before logging).
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr, 
                   const std::string& message = "") {
        if (level < min_level()) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        
        struct tm gmt;
        gmtime_r(&time_t, &gmt);
        
        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] ";
        
        ss << "peer=" << blind(remote_addr);
        
        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        
        std::lock_guard<std::mutex> lock(output_mutex());
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    static void set_min_level(Level level) { min_level() = level; }

    // Hashes an identifier with the current rotating salt.
    // "internal", "unknown" and empty identifiers are passed through.
    static std::string blind(const std::string& id) {
        if (id.empty() || id == "unknown" || id == "internal") {
            return id.empty() ? "-" : id;
        }

        std::string data = id + current_salt();
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }
    
private:
    static Level& min_level() {
        static Level level = Level::INFO;
        return level;
    }

    static std::mutex& output_mutex() {
        static std::mutex m;
        return m;
    }

    // A random salt is generated and rotated every 6 hours so that past
    // peer-to-hash mappings cannot be reversed once the salt is gone.
    static std::string current_salt() {
        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::lock_guard<std::mutex> lock(salt_mutex);
        auto now_steady = std::chrono::steady_clock::now();
        if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
            unsigned char b[32];
            if (RAND_bytes(b, 32) != 1) {
                std::cerr << "[CRITICAL] CSPRNG failure in SecurityLogger. Terminating instance for safety.\n";
                std::terminate(); 
            }
            std::stringstream salt_ss;
            for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
            log_salt = salt_ss.str();
            last_rotation = now_steady;
        }
        return log_salt;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }
    
    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::AUTH_SUCCESS: return "AUTH_SUCCESS";
            case EventType::AUTH_FAILURE: return "AUTH_FAILURE";
            case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::ORIGIN_REJECTED: return "ORIGIN_REJECTED";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::CONNECTION_OPENED: return "CONN_OPENED";
            case EventType::CONNECTION_CLOSED: return "CONN_CLOSED";
            case EventType::DEPENDENCY_FAILURE: return "DEPENDENCY";
            case EventType::INTERNAL_ERROR: return "INTERNAL";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
