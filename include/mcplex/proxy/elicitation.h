#pragma once

#include <mcplex/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplex::proxy {

using json = nlohmann::json;

enum class ElicitationAction { Accept, Decline, Cancel };

const char* toString(ElicitationAction action) noexcept;

// One input requested by a backend operation. `type` is a JSON schema type name.
struct ElicitationField {
    std::string name;
    std::string type{"string"};
    bool required{false};
    std::string description;
    std::optional<json> defaultValue;
    std::optional<std::vector<json>> enumValues;
    std::optional<json> constValue;

    json toJson() const;
};

// Builds fields from a JSON schema's `properties`/`required`. Missing `type` means string.
std::vector<ElicitationField> parseFieldsFromSchema(const json& requestedSchema);

// Parses raw operator input by the field's declared type. Errors are InvalidArgument.
Result<json> parseFieldValue(const ElicitationField& field, std::string_view input);

struct ElicitationRecord {
    std::string message;
    std::vector<ElicitationField> fieldSchema;
    json collectedValues = json::object();
    ElicitationAction action{ElicitationAction::Accept};
    TimePoint timestamp{};

    json toJson() const;
};

enum class ElicitationState { Idle, AwaitingFieldSchema, CollectingFields, Resolved };

/**
 * Input collection for a single elicitation request, with no threading of its own.
 *
 * open() moves Idle -> AwaitingFieldSchema and, when the schema declares fields, on to
 * CollectingFields at index 0. Without fields the session stays in AwaitingFieldSchema
 * and the next submission resolves it: a null or empty schema is an acknowledgment and
 * resolves to `{}`, any other schema takes the raw input string as the value.
 *
 * The tokens `decline` and `cancel` (any case) resolve immediately from either state,
 * keeping whatever fields were already collected.
 */
class ElicitationSession {
public:
    ElicitationSession() = default;

    void open(std::string message, const json& requestedSchema);

    // Rejected input leaves the state untouched and returns the reason.
    Result<void> submit(std::string_view input);
    void cancel();

    ElicitationState state() const noexcept { return state_; }
    bool resolved() const noexcept { return state_ == ElicitationState::Resolved; }
    std::optional<ElicitationAction> action() const noexcept { return action_; }

    const std::string& message() const noexcept { return message_; }
    const std::vector<ElicitationField>& fields() const noexcept { return fields_; }
    std::size_t fieldIndex() const noexcept { return index_; }
    const ElicitationField* currentField() const noexcept;
    const json& collected() const noexcept { return collected_; }

    // Human readable prompt for the current step.
    std::string promptText() const;

    ElicitationRecord record() const;

private:
    void resolve(ElicitationAction action);
    Result<void> submitFreeForm(const std::string& value);
    Result<void> submitField(const std::string& value);
    void advance();

    ElicitationState state_{ElicitationState::Idle};
    std::optional<ElicitationAction> action_;
    std::string message_;
    std::vector<ElicitationField> fields_;
    bool acknowledgeOnly_{false};
    std::size_t index_{0};
    json collected_ = json::object();
    TimePoint openedAt_{};
};

struct ElicitationOutcome {
    ElicitationAction action{ElicitationAction::Accept};
    // Response handed back to the backend; null unless accepted.
    json content;
    // Audit entry for this round, also appended to the coordinator history.
    ElicitationRecord record;
};

struct ElicitationPrompt {
    std::string message;
    std::string text;
    std::optional<ElicitationField> field;
    std::size_t fieldIndex{0};
    std::size_t fieldCount{0};
};

struct ElicitationOptions {
    std::chrono::milliseconds pollInterval{100};
    // Unset means wait for the operator indefinitely; on expiry the request resolves Cancel.
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * Bridges the backend task that asked for input (elicit(), which blocks) and the
 * foreground that collects it (submit()/cancel()). At most one request is pending at a
 * time; concurrent elicit() calls queue behind it.
 */
class ElicitationCoordinator {
public:
    // Converts the accepted field map into the backend's expected response shape.
    using ResponseBuilder = std::function<json(const json& collected)>;
    using PendingListener = std::function<void(const ElicitationPrompt&)>;

    explicit ElicitationCoordinator(ElicitationOptions options = {});
    ~ElicitationCoordinator();

    ElicitationCoordinator(const ElicitationCoordinator&) = delete;
    ElicitationCoordinator& operator=(const ElicitationCoordinator&) = delete;

    ElicitationOutcome elicit(const std::string& message, const json& requestedSchema,
                              ResponseBuilder builder = {});

    Result<void> submit(std::string_view input);
    bool cancel();
    bool hasPending() const;
    std::optional<ElicitationPrompt> currentPrompt() const;

    // Called on the elicit() thread whenever a new request becomes pending.
    void setPendingListener(PendingListener listener);

    // Clears history; the proxy calls this before every forwarded request.
    void beginExecution();
    std::vector<ElicitationRecord> history() const;
    json historyJson() const;

private:
    struct Pending;

    std::optional<ElicitationPrompt> promptLocked() const;

    ElicitationOptions options_;
    std::mutex turnMu_;
    mutable std::mutex mu_;
    std::unique_ptr<Pending> pending_;
    std::vector<ElicitationRecord> history_;
    PendingListener listener_;
};

} // namespace mcplex::proxy
