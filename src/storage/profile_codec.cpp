#include <learnvault/storage/profile_codec.h>

#include <chjson/chjson.hpp>

#include <utility>

namespace learnvault::storage {
namespace {

chjson::value OptionalString(const std::optional<std::string>& s) {
    if (!s) {
        return chjson::value();
    }
    return chjson::value(*s);
}

void ReadString(const chjson::sv_value& obj, std::string_view key, std::string& out) {
    const auto* v = obj.find(key);
    if (v != nullptr && v->is_string()) {
        out = std::string(v->as_string_view());
    }
}

void ReadOptionalString(const chjson::sv_value& obj, std::string_view key, std::optional<std::string>& out) {
    const auto* v = obj.find(key);
    if (v != nullptr && v->is_string()) {
        out = std::string(v->as_string_view());
    } else {
        out.reset();
    }
}

void ReadDouble(const chjson::sv_value& obj, std::string_view key, double& out) {
    const auto* v = obj.find(key);
    if (v == nullptr || !v->is_number()) {
        return;
    }
    out = v->is_int() ? static_cast<double>(v->as_int()) : v->as_double();
}

void ReadBool(const chjson::sv_value& obj, std::string_view key, bool& out) {
    const auto* v = obj.find(key);
    if (v != nullptr && v->is_bool()) {
        out = v->as_bool();
    }
}

learnvault::Status Invalid(std::string message) {
    return learnvault::Status(learnvault::StatusCode::invalid_argument, std::move(message));
}

} // namespace

std::string EncodeProfile(const LearnerProfile& p) {
    const auto& cog = p.cognitive_profile;
    const auto& priv = p.privacy_settings;

    chjson::value j(chjson::value::object{
        {"id", chjson::value(p.id)},
        {"tenant_id", chjson::value(p.tenant_id)},
        {"lti_user_id", chjson::value(p.lti_user_id)},
        {"lti_deployment_id", chjson::value(p.lti_deployment_id)},
        {"email", OptionalString(p.email)},
        {"name", OptionalString(p.name)},
        {"cognitive_profile", chjson::value(chjson::value::object{
            {"forgetting_curve_s", chjson::value(cog.forgetting_curve_s)},
            {"learning_velocity", chjson::value(cog.learning_velocity)},
            {"optimal_difficulty", chjson::value(cog.optimal_difficulty)},
            {"preferred_modality", chjson::value(cog.preferred_modality)},
        })},
        {"privacy_settings", chjson::value(chjson::value::object{
            {"data_sharing_consent", chjson::value(priv.data_sharing_consent)},
            {"ai_interaction_consent", chjson::value(priv.ai_interaction_consent)},
            {"anonymous_analytics", chjson::value(priv.anonymous_analytics)},
        })},
        {"created_at", chjson::value(p.created_at)},
        {"updated_at", chjson::value(p.updated_at)},
    });
    return chjson::dump(j);
}

learnvault::Result<LearnerProfile> DecodeProfile(const std::string& text) {
    auto r = chjson::parse(text);
    if (r.err) {
        return Invalid("profile is not valid json");
    }
    const auto& root = r.doc.root();
    if (!root.is_object()) {
        return Invalid("profile root must be a JSON object");
    }

    const auto* tenant = root.find("tenant_id");
    const auto* subject = root.find("lti_user_id");
    if (tenant == nullptr || !tenant->is_string() || tenant->as_string_view().empty()) {
        return Invalid("profile has no tenant_id");
    }
    if (subject == nullptr || !subject->is_string() || subject->as_string_view().empty()) {
        return Invalid("profile has no lti_user_id");
    }

    LearnerProfile p;
    p.tenant_id = std::string(tenant->as_string_view());
    p.lti_user_id = std::string(subject->as_string_view());
    ReadString(root, "id", p.id);
    ReadString(root, "lti_deployment_id", p.lti_deployment_id);
    ReadOptionalString(root, "email", p.email);
    ReadOptionalString(root, "name", p.name);
    ReadString(root, "created_at", p.created_at);
    ReadString(root, "updated_at", p.updated_at);

    if (const auto* cog = root.find("cognitive_profile"); cog != nullptr && cog->is_object()) {
        ReadDouble(*cog, "forgetting_curve_s", p.cognitive_profile.forgetting_curve_s);
        ReadDouble(*cog, "learning_velocity", p.cognitive_profile.learning_velocity);
        ReadDouble(*cog, "optimal_difficulty", p.cognitive_profile.optimal_difficulty);
        ReadString(*cog, "preferred_modality", p.cognitive_profile.preferred_modality);
    }
    if (const auto* priv = root.find("privacy_settings"); priv != nullptr && priv->is_object()) {
        ReadBool(*priv, "data_sharing_consent", p.privacy_settings.data_sharing_consent);
        ReadBool(*priv, "ai_interaction_consent", p.privacy_settings.ai_interaction_consent);
        ReadBool(*priv, "anonymous_analytics", p.privacy_settings.anonymous_analytics);
    }
    return p;
}

std::string MakeCacheKey(std::string_view entity_type, std::string_view tenant, std::string_view subject) {
    std::string key;
    key.reserve(10 + entity_type.size() + tenant.size() + subject.size());
    key.append("fallback:");
    key.append(entity_type);
    key.push_back(':');
    key.append(tenant);
    key.push_back(':');
    key.append(subject);
    return key;
}

} // namespace learnvault::storage
