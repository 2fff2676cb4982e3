/*
 * SPDX-FileCopyrightText: 2025 Ledger Signer Hotplug Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <QDebug>
#include <QMetaType>

namespace LedgerSigner {
namespace Shared {

/**
 * @brief Address derivation schemes supported by Ledger signers
 *
 * Values are persisted by name in the configuration file
 * (see ConfigKeys::DERIVATION), never by number.
 */
enum class DerivationScheme : uint8_t {
    Live = 0,      ///< Ledger Live layout, one address per account up to the account limit
    Legacy = 1,    ///< Legacy MEW/MyCrypto layout
    Standard = 2,  ///< BIP44 standard layout
    Testnet = 3    ///< Testnet coin type
};

/**
 * @brief Global derivation configuration applied to every signer
 *
 * accountLimit is meaningful only for DerivationScheme::Live. Use
 * effective() to obtain the normalized pair that signers carry.
 */
struct DerivationConfig {
    DerivationScheme scheme = DerivationScheme::Live;
    int accountLimit = 0;

    /**
     * @brief Normalizes the pair
     * @return Copy with accountLimit forced to 0 unless scheme is Live
     *         (negative limits are clamped to 0)
     */
    [[nodiscard]] DerivationConfig effective() const;

    bool operator==(const DerivationConfig &other) const {
        return scheme == other.scheme && accountLimit == other.accountLimit;
    }
    bool operator!=(const DerivationConfig &other) const {
        return !(*this == other);
    }
};

/**
 * @brief Converts scheme to its persisted name
 * @return "live", "legacy", "standard" or "testnet"
 */
QString derivationSchemeToString(DerivationScheme scheme);

/**
 * @brief Parses persisted scheme name (case-insensitive)
 * @param schemeStr Persisted name
 * @param ok Set to false when the name is unknown (may be nullptr)
 * @return Parsed scheme, DerivationScheme::Live if unknown
 */
DerivationScheme derivationSchemeFromString(const QString &schemeStr, bool *ok = nullptr);

/**
 * @brief Gets localized scheme name for display
 */
QString derivationSchemeName(DerivationScheme scheme);

} // namespace Shared
} // namespace LedgerSigner

QDebug operator<<(QDebug debug, const LedgerSigner::Shared::DerivationConfig &config);

Q_DECLARE_METATYPE(LedgerSigner::Shared::DerivationScheme)
Q_DECLARE_METATYPE(LedgerSigner::Shared::DerivationConfig)
