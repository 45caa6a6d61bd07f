#include "unlock/wallet_key.h"
#include <openssl/crypto.h>
#include <utility>

namespace WalletCore {

WalletKey::WalletKey(QByteArray bytes)
    : m_bytes(std::move(bytes))
{
    // Own the only reference so clear() wipes the buffer we actually hold
    m_bytes.detach();
}

WalletKey::~WalletKey()
{
    clear();
}

WalletKey::WalletKey(WalletKey&& other) noexcept
    : m_bytes(std::move(other.m_bytes))
{
    other.m_bytes = QByteArray();
}

WalletKey& WalletKey::operator=(WalletKey&& other) noexcept
{
    if (this != &other) {
        clear();
        m_bytes = std::move(other.m_bytes);
        other.m_bytes = QByteArray();
    }
    return *this;
}

void WalletKey::clear()
{
    if (!m_bytes.isEmpty()) {
        OPENSSL_cleanse(m_bytes.data(), static_cast<size_t>(m_bytes.size()));
    }
    m_bytes = QByteArray();
}

} // namespace WalletCore
