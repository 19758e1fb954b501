#include <mcplex/config/config_helpers.h>
#include <mcplex/proxy/elicitation.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <future>

namespace mcplex::proxy {

namespace {

bool isAcknowledgmentSchema(const json& schema) {
    return schema.is_null() || (schema.is_object() && schema.empty());
}

std::string describeJson(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

std::int64_t toEpochMs(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

const char* toString(ElicitationAction action) noexcept {
    switch (action) {
        case ElicitationAction::Accept:
            return "accept";
        case ElicitationAction::Decline:
            return "decline";
        case ElicitationAction::Cancel:
            return "cancel";
    }
    return "cancel";
}

json ElicitationField::toJson() const {
    json j{{"name", name}, {"type", type}, {"required", required}, {"description", description}};
    if (defaultValue)
        j["default"] = *defaultValue;
    if (enumValues)
        j["enum"] = *enumValues;
    if (constValue)
        j["const"] = *constValue;
    return j;
}

std::vector<ElicitationField> parseFieldsFromSchema(const json& requestedSchema) {
    std::vector<ElicitationField> fields;
    if (!requestedSchema.is_object())
        return fields;
    auto props = requestedSchema.find("properties");
    if (props == requestedSchema.end() || !props->is_object())
        return fields;

    std::vector<std::string> required;
    if (auto it = requestedSchema.find("required"); it != requestedSchema.end() && it->is_array()) {
        for (const auto& r : *it) {
            if (r.is_string())
                required.push_back(r.get<std::string>());
        }
    }

    for (const auto& [name, prop] : props->items()) {
        ElicitationField field;
        field.name = name;
        field.required = std::find(required.begin(), required.end(), name) != required.end();
        if (prop.is_object()) {
            if (auto t = prop.find("type"); t != prop.end() && t->is_string())
                field.type = t->get<std::string>();
            if (auto d = prop.find("description"); d != prop.end() && d->is_string())
                field.description = d->get<std::string>();
            else if (auto t = prop.find("title"); t != prop.end() && t->is_string())
                field.description = t->get<std::string>();
            if (auto d = prop.find("default"); d != prop.end() && !d->is_null())
                field.defaultValue = *d;
            if (auto e = prop.find("enum"); e != prop.end() && e->is_array())
                field.enumValues = e->get<std::vector<json>>();
            if (auto c = prop.find("const"); c != prop.end())
                field.constValue = *c;
        }
        fields.push_back(std::move(field));
    }
    return fields;
}

Result<json> parseFieldValue(const ElicitationField& field, std::string_view input) {
    const std::string value(input);
    if (field.type == "integer") {
        std::int64_t parsed = 0;
        const char* first = value.data();
        const char* last = value.data() + value.size();
        // from_chars takes no '+' sign; a sign must still be followed by a digit.
        if (value.size() > 1 && value[0] == '+' && value[1] != '-')
            ++first;
        auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (value.empty() || ec != std::errc{} || ptr != last)
            return Error{ErrorCode::InvalidArgument, "Invalid integer: " + value};
        return json(parsed);
    }
    if (field.type == "number") {
        char* end = nullptr;
        const double parsed = std::strtod(value.c_str(), &end);
        if (value.empty() || end != value.c_str() + value.size() || !std::isfinite(parsed))
            return Error{ErrorCode::InvalidArgument, "Invalid number: " + value};
        return json(parsed);
    }
    if (field.type == "boolean") {
        const auto lowered = config::to_lower(value);
        return json(lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "y");
    }
    if (field.type == "object" || field.type == "array") {
        auto parsed = json::parse(value, nullptr, /*allow_exceptions=*/false);
        if (parsed.is_discarded())
            return Error{ErrorCode::InvalidArgument, "Invalid JSON for " + field.type + " field"};
        if (field.type == "object" && !parsed.is_object())
            return Error{ErrorCode::InvalidArgument, "Expected a JSON object"};
        if (field.type == "array" && !parsed.is_array())
            return Error{ErrorCode::InvalidArgument, "Expected a JSON array"};
        return parsed;
    }
    return json(value);
}

json ElicitationRecord::toJson() const {
    json schema = json::array();
    for (const auto& f : fieldSchema)
        schema.push_back(f.toJson());
    return json{{"message", message},
                {"field_schema", std::move(schema)},
                {"collected_values", collectedValues},
                {"action", toString(action)},
                {"timestamp_ms", toEpochMs(timestamp)}};
}

// ElicitationSession

void ElicitationSession::open(std::string message, const json& requestedSchema) {
    message_ = std::move(message);
    fields_ = parseFieldsFromSchema(requestedSchema);
    acknowledgeOnly_ = fields_.empty() && isAcknowledgmentSchema(requestedSchema);
    index_ = 0;
    collected_ = json::object();
    action_.reset();
    openedAt_ = std::chrono::system_clock::now();

    state_ = ElicitationState::AwaitingFieldSchema;
    if (!fields_.empty())
        state_ = ElicitationState::CollectingFields;
}

const ElicitationField* ElicitationSession::currentField() const noexcept {
    if (state_ != ElicitationState::CollectingFields || index_ >= fields_.size())
        return nullptr;
    return &fields_[index_];
}

Result<void> ElicitationSession::submit(std::string_view input) {
    if (state_ == ElicitationState::Idle || state_ == ElicitationState::Resolved)
        return Error{ErrorCode::InvalidState, "No elicitation is awaiting input"};

    std::string value(input);
    config::trim(value);
    const auto lowered = config::to_lower(value);
    if (lowered == "decline") {
        resolve(ElicitationAction::Decline);
        return {};
    }
    if (lowered == "cancel") {
        resolve(ElicitationAction::Cancel);
        return {};
    }

    if (state_ == ElicitationState::AwaitingFieldSchema)
        return submitFreeForm(value);
    return submitField(value);
}

Result<void> ElicitationSession::submitFreeForm(const std::string& value) {
    if (acknowledgeOnly_) {
        collected_ = json::object();
    } else {
        if (value.empty())
            return Error{ErrorCode::InvalidArgument, "A response is required"};
        collected_ = value;
    }
    resolve(ElicitationAction::Accept);
    return {};
}

Result<void> ElicitationSession::submitField(const std::string& value) {
    const auto& field = fields_[index_];

    if (value.empty()) {
        if (field.required)
            return Error{ErrorCode::InvalidArgument, "Field '" + field.name + "' is required"};
        if (field.defaultValue)
            collected_[field.name] = *field.defaultValue;
        advance();
        return {};
    }

    auto parsed = parseFieldValue(field, value);
    if (!parsed)
        return parsed.error();

    const json& v = parsed.value();
    if (field.enumValues &&
        std::find(field.enumValues->begin(), field.enumValues->end(), v) == field.enumValues->end()) {
        std::string options;
        for (const auto& e : *field.enumValues) {
            if (!options.empty())
                options += ", ";
            options += describeJson(e);
        }
        return Error{ErrorCode::InvalidArgument, "Invalid value. Must be one of: " + options};
    }
    if (field.constValue && v != *field.constValue)
        return Error{ErrorCode::InvalidArgument, "Value must be: " + describeJson(*field.constValue)};

    collected_[field.name] = v;
    advance();
    return {};
}

void ElicitationSession::advance() {
    ++index_;
    if (index_ >= fields_.size())
        resolve(ElicitationAction::Accept);
}

void ElicitationSession::cancel() {
    if (state_ == ElicitationState::Idle || state_ == ElicitationState::Resolved)
        return;
    resolve(ElicitationAction::Cancel);
}

void ElicitationSession::resolve(ElicitationAction action) {
    action_ = action;
    state_ = ElicitationState::Resolved;
}

std::string ElicitationSession::promptText() const {
    switch (state_) {
        case ElicitationState::Idle:
            return {};
        case ElicitationState::Resolved:
            return fmt::format("Elicitation {}", toString(action_.value_or(ElicitationAction::Cancel)));
        case ElicitationState::AwaitingFieldSchema:
            if (acknowledgeOnly_)
                return "Press Enter to acknowledge, or type 'decline' or 'cancel'";
            return "Type your response, or 'decline' or 'cancel'";
        case ElicitationState::CollectingFields:
            break;
    }

    const auto& f = fields_[index_];
    std::string text = fmt::format("[{}/{}] {} ({}){}", index_ + 1, fields_.size(), f.name, f.type,
                                   f.required ? " [required]" : " [optional]");
    if (!f.description.empty())
        text += ": " + f.description;
    if (f.enumValues) {
        std::string options;
        for (const auto& e : *f.enumValues) {
            if (!options.empty())
                options += ", ";
            options += describeJson(e);
        }
        text += " {" + options + "}";
    }
    if (f.defaultValue)
        text += " (default: " + describeJson(*f.defaultValue) + ")";
    return text;
}

ElicitationRecord ElicitationSession::record() const {
    ElicitationRecord rec;
    rec.message = message_;
    rec.fieldSchema = fields_;
    rec.collectedValues = collected_;
    rec.action = action_.value_or(ElicitationAction::Cancel);
    rec.timestamp = openedAt_;
    return rec;
}

// ElicitationCoordinator

struct ElicitationCoordinator::Pending {
    ElicitationSession session;
    std::promise<void> done;
    bool signalled{false};

    void signalIfResolved() {
        if (session.resolved() && !signalled) {
            signalled = true;
            done.set_value();
        }
    }
};

ElicitationCoordinator::ElicitationCoordinator(ElicitationOptions options)
    : options_(options) {
    if (options_.pollInterval.count() <= 0)
        options_.pollInterval = std::chrono::milliseconds(100);
}

ElicitationCoordinator::~ElicitationCoordinator() = default;

ElicitationOutcome ElicitationCoordinator::elicit(const std::string& message,
                                                  const json& requestedSchema,
                                                  ResponseBuilder builder) {
    std::unique_lock<std::mutex> turn(turnMu_);

    std::future<void> resolved;
    std::optional<ElicitationPrompt> prompt;
    PendingListener listener;
    {
        std::lock_guard<std::mutex> lk(mu_);
        pending_ = std::make_unique<Pending>();
        pending_->session.open(message, requestedSchema);
        resolved = pending_->done.get_future();
        prompt = promptLocked();
        listener = listener_;
    }
    spdlog::debug("[Elicitation] Request pending: {}", message);

    if (listener && prompt) {
        try {
            listener(*prompt);
        } catch (const std::exception& e) {
            spdlog::warn("[Elicitation] Pending listener failed: {}", e.what());
        }
    }

    const auto started = std::chrono::steady_clock::now();
    while (resolved.wait_for(options_.pollInterval) != std::future_status::ready) {
        if (!options_.timeout)
            continue;
        if (std::chrono::steady_clock::now() - started < *options_.timeout)
            continue;
        std::lock_guard<std::mutex> lk(mu_);
        if (pending_ && !pending_->session.resolved()) {
            spdlog::warn("[Elicitation] Request timed out after {} ms", options_.timeout->count());
            pending_->session.cancel();
        }
        break;
    }

    ElicitationRecord record;
    {
        std::lock_guard<std::mutex> lk(mu_);
        record = pending_->session.record();
        pending_.reset();
        history_.push_back(record);
    }
    spdlog::debug("[Elicitation] Resolved: {}", toString(record.action));

    ElicitationOutcome outcome;
    outcome.action = record.action;
    outcome.record = record;
    if (record.action != ElicitationAction::Accept)
        return outcome;

    outcome.content = record.collectedValues;
    if (builder && record.collectedValues.is_object()) {
        try {
            outcome.content = builder(record.collectedValues);
        } catch (const std::exception& e) {
            spdlog::warn("[Elicitation] Failed to build response, returning raw values: {}",
                         e.what());
        }
    }
    return outcome;
}

Result<void> ElicitationCoordinator::submit(std::string_view input) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!pending_)
        return Error{ErrorCode::InvalidState, "No pending elicitation"};
    auto r = pending_->session.submit(input);
    pending_->signalIfResolved();
    return r;
}

bool ElicitationCoordinator::cancel() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!pending_ || pending_->session.resolved())
        return false;
    pending_->session.cancel();
    pending_->signalIfResolved();
    return true;
}

bool ElicitationCoordinator::hasPending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_ && !pending_->session.resolved();
}

std::optional<ElicitationPrompt> ElicitationCoordinator::currentPrompt() const {
    std::lock_guard<std::mutex> lk(mu_);
    return promptLocked();
}

std::optional<ElicitationPrompt> ElicitationCoordinator::promptLocked() const {
    if (!pending_ || pending_->session.resolved())
        return std::nullopt;
    const auto& s = pending_->session;
    ElicitationPrompt p;
    p.message = s.message();
    p.text = s.promptText();
    if (const auto* f = s.currentField())
        p.field = *f;
    p.fieldIndex = s.fieldIndex();
    p.fieldCount = s.fields().size();
    return p;
}

void ElicitationCoordinator::setPendingListener(PendingListener listener) {
    std::lock_guard<std::mutex> lk(mu_);
    listener_ = std::move(listener);
}

void ElicitationCoordinator::beginExecution() {
    std::lock_guard<std::mutex> lk(mu_);
    history_.clear();
}

std::vector<ElicitationRecord> ElicitationCoordinator::history() const {
    std::lock_guard<std::mutex> lk(mu_);
    return history_;
}

json ElicitationCoordinator::historyJson() const {
    std::lock_guard<std::mutex> lk(mu_);
    json out = json::array();
    for (const auto& r : history_)
        out.push_back(r.toJson());
    return out;
}

} // namespace mcplex::proxy
