#include <uuidcraft/crypto.h>
#include <uuidcraft/name_based.h>

namespace uuidcraft {

  Uuid NameBasedUuidCreator::hash(const std::optional<Uuid>& name_space, const uint8_t* name,
                                  size_t len) const {
    std::vector<uint8_t> data;
    data.reserve(UUID_SIZE + len);

    if (name_space) {
      UuidBytes ns = name_space->to_bytes();
      data.insert(data.end(), ns.begin(), ns.end());
    }
    data.insert(data.end(), name, name + len);

    // Both digests are at least 16 bytes; only the first 16 are kept
    Uuid raw;
    if (config_.hash == NameHash::MD5) {
      raw = Uuid::from_bytes(crypto::md5(data).data());
    } else {
      raw = Uuid::from_bytes(crypto::sha1(data).data());
    }

    return Uuid(apply_version_bits(raw.most_significant_bits(), version()),
                apply_variant_bits(raw.least_significant_bits()));
  }

  Uuid NameBasedUuidCreator::create(const Uuid& name_space, const std::vector<uint8_t>& name) const {
    return hash(name_space, name.data(), name.size());
  }

  Uuid NameBasedUuidCreator::create(const Uuid& name_space, const std::string& name) const {
    return hash(name_space, reinterpret_cast<const uint8_t*>(name.data()), name.size());
  }

  Uuid NameBasedUuidCreator::create(const std::vector<uint8_t>& name) const {
    return hash(config_.name_space, name.data(), name.size());
  }

  Uuid NameBasedUuidCreator::create(const std::string& name) const {
    return hash(config_.name_space, reinterpret_cast<const uint8_t*>(name.data()), name.size());
  }

  UuidVersion NameBasedUuidCreator::version() const {
    return config_.hash == NameHash::MD5 ? UuidVersion::NAME_BASED_MD5 : UuidVersion::NAME_BASED_SHA1;
  }

}  // namespace uuidcraft
