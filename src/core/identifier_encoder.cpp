#include "identifier_encoder.h"
#include "errors.h"
#include "../utils/base36.h"

#include <libp2p/crypto/key.hpp>
#include <libp2p/crypto/key_marshaller/key_marshaller_impl.hpp>
#include <libp2p/crypto/protobuf/protobuf_key.hpp>
#include <libp2p/multi/content_identifier.hpp>
#include <libp2p/multi/content_identifier_codec.hpp>
#include <libp2p/multi/multicodec_type.hpp>
#include <libp2p/multi/multihash.hpp>
#include <libp2p/peer/peer_id.hpp>

using libp2p::multi::ContentIdentifier;
using libp2p::multi::ContentIdentifierCodec;
using libp2p::multi::HashType;
using libp2p::multi::MulticodecType;
using libp2p::multi::Multihash;

Bytes IdentifierEncoder::publicKeyEnvelope(const Bytes& publicKey) {
    if (publicKey.size() != CryptoHelper::ED25519_KEY_LENGTH) {
        throw EncodingError("Ed25519 public key must be " +
                            std::to_string(CryptoHelper::ED25519_KEY_LENGTH) +
                            " bytes, got " + std::to_string(publicKey.size()));
    }

    libp2p::crypto::PublicKey key;
    key.type = libp2p::crypto::Key::Type::Ed25519;
    key.data.assign(publicKey.begin(), publicKey.end());

    // Only unmarshalling consults the key validator.
    libp2p::crypto::marshaller::KeyMarshallerImpl marshaller(nullptr);
    auto marshalled = marshaller.marshal(key);
    if (marshalled.has_error()) {
        throw EncodingError("failed to marshal public key: " + marshalled.error().message());
    }
    const auto& envelope = marshalled.value().key;
    return Bytes(envelope.begin(), envelope.end());
}

std::string IdentifierEncoder::encode(const Bytes& publicKey) const {
    Bytes envelope = publicKeyEnvelope(publicKey);

    auto multihash = [&]() -> Multihash {
        if (hashMode == HashMode::Libp2pInline) {
            auto peerId = libp2p::peer::PeerId::fromPublicKey(libp2p::crypto::ProtobufKey{envelope});
            if (peerId.has_error()) {
                throw EncodingError("failed to build peer ID: " + peerId.error().message());
            }
            return peerId.value().toMultihash();
        }

        Bytes digest;
        try {
            digest = CryptoHelper::sha256Bytes(envelope);
        } catch (const CryptoError& e) {
            throw EncodingError(std::string("failed to hash public key envelope: ") + e.what());
        }
        auto created = Multihash::create(HashType::sha256, digest);
        if (created.has_error()) {
            throw EncodingError("failed to build multihash: " + created.error().message());
        }
        return created.value();
    }();

    ContentIdentifier cid(ContentIdentifier::Version::V1, MulticodecType::Code::LIBP2P_KEY, multihash);
    auto encoded = ContentIdentifierCodec::encode(cid);
    if (encoded.has_error()) {
        throw EncodingError("failed to encode CID: " + encoded.error().message());
    }
    const auto& cidBytes = encoded.value();
    return Base36::encodeMultibase(Bytes(cidBytes.begin(), cidBytes.end()));
}

DecodedIdentifier IdentifierEncoder::decode(const std::string& identifier) {
    Bytes cidBytes;
    try {
        cidBytes = Base36::decodeMultibase(identifier);
    } catch (const Base36::FormatError& e) {
        throw EncodingError("invalid identifier '" + identifier + "': " + e.what());
    }

    auto decoded = ContentIdentifierCodec::decode(cidBytes);
    if (decoded.has_error()) {
        throw EncodingError("invalid identifier '" + identifier + "': " + decoded.error().message());
    }
    const ContentIdentifier& cid = decoded.value();
    if (cid.version != ContentIdentifier::Version::V1) {
        throw EncodingError("invalid identifier '" + identifier + "': only CIDv1 is supported");
    }

    DecodedIdentifier result;
    result.version = static_cast<std::uint64_t>(cid.version);
    result.codec = static_cast<std::uint64_t>(cid.content_type);
    result.multihashCode = static_cast<std::uint64_t>(cid.content_address.getType());
    const auto hash = cid.content_address.getHash();
    result.digest.assign(hash.begin(), hash.end());
    return result;
}
