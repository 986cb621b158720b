#pragma once

#include <string>
#include <string_view>

#include <learnvault/core/status.h>
#include <learnvault/storage/learner_profile.h>

namespace learnvault::storage {

// JSON text shared with the cache store. Field names match the primary store's columns, with
// cognitive_profile and privacy_settings as nested objects. Absent email/name are written as null.
std::string EncodeProfile(const LearnerProfile& profile);

// Fails with invalid_argument on malformed JSON, a non-object root, or a missing, empty or non-string
// tenant_id or lti_user_id. Other missing fields keep their defaults.
learnvault::Result<LearnerProfile> DecodeProfile(const std::string& text);

// "fallback:{entity_type}:{tenant}:{subject}"
std::string MakeCacheKey(std::string_view entity_type, std::string_view tenant, std::string_view subject);

} // namespace learnvault::storage
