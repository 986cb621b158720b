#pragma once

#include <optional>
#include <string>

namespace learnvault::storage {

struct CognitiveProfile {
    double forgetting_curve_s = 1.0;
    double learning_velocity = 1.0;
    double optimal_difficulty = 0.7;
    std::string preferred_modality = "visual";

    bool operator==(const CognitiveProfile&) const = default;
};

struct PrivacySettings {
    bool data_sharing_consent = false;
    bool ai_interaction_consent = false;
    bool anonymous_analytics = false;

    bool operator==(const PrivacySettings&) const = default;
};

// One learner within one tenant. (tenant_id, lti_user_id) is the identity; every other field is
// opaque payload to the storage layer and is replaced wholesale on save.
struct LearnerProfile {
    std::string id;
    std::string tenant_id;
    std::string lti_user_id;
    std::string lti_deployment_id;
    std::optional<std::string> email;
    std::optional<std::string> name;
    CognitiveProfile cognitive_profile;
    PrivacySettings privacy_settings;
    std::string created_at;
    std::string updated_at;

    bool operator==(const LearnerProfile&) const = default;
};

} // namespace learnvault::storage
