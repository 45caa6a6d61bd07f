#pragma once

#include <QByteArray>

namespace WalletCore {

/**
 * @brief Owner of the wallet's master secret
 *
 * Move-only. The bytes are cleansed with OPENSSL_cleanse when the key is
 * cleared, destroyed, or overwritten by move-assignment.
 *
 * Hand buffers over with std::move. A buffer that is still shared with the
 * caller is deep-copied, and the caller's copy stays the caller's to wipe.
 */
class WalletKey {
public:
    WalletKey() = default;
    explicit WalletKey(QByteArray bytes);
    ~WalletKey();

    WalletKey(WalletKey&& other) noexcept;
    WalletKey& operator=(WalletKey&& other) noexcept;

    WalletKey(const WalletKey&) = delete;
    WalletKey& operator=(const WalletKey&) = delete;

    bool isEmpty() const { return m_bytes.isEmpty(); }
    int size() const { return static_cast<int>(m_bytes.size()); }
    const QByteArray& bytes() const { return m_bytes; }

    /**
     * @brief Cleanse and release the secret
     */
    void clear();

private:
    QByteArray m_bytes;
};

} // namespace WalletCore
