#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>

namespace crl {

// ContextNormalizer -- canonical Q-table key for a strategic context.
//
// Case and whitespace insensitive, idempotent:
//   normalize(normalize(x)) == normalize(x)
// Returns nullopt for empty or whitespace-only input.
class ContextNormalizer {
public:
    static std::optional<QString> normalize(const QString& raw);
    static std::optional<QString> normalize(const CampaignContext& context);
};

} // namespace crl
