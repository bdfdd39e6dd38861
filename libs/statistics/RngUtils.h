// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <type_traits>
#include <utility>
#include <vector>

namespace mcsig
{
  namespace rng_utils
  {
    // Detects wrappers such as randutils::mt19937_rng that expose .engine()
    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>> : std::true_type {};

    // Reference to the underlying engine, whether wrapped or direct.
    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
	return rng.engine();
      else
	return rng;
    }

    // Raw 64-bit draw, used to seed per-trial engines from a master generator.
    template <typename Rng>
    inline std::uint64_t get_random_value(Rng& rng)
    {
      auto& eng = get_engine(rng);
      using Engine = std::remove_reference_t<decltype(eng)>;

      if constexpr (Engine::max() - Engine::min() >= 0xffffffffffffffffull)
	return static_cast<std::uint64_t>(eng() - Engine::min());
      else
	{
	  // 32-bit engines: combine two draws
	  const std::uint64_t hi = static_cast<std::uint64_t>(eng() - Engine::min()) & 0xffffffffull;
	  const std::uint64_t lo = static_cast<std::uint64_t>(eng() - Engine::min()) & 0xffffffffull;
	  return (hi << 32) | lo;
	}
    }

    /**
     * @brief Uniform index in [0, hiExclusive) without modulo bias.
     * @pre hiExclusive > 0 (returns 0 otherwise)
     */
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t hiExclusive)
    {
      if (hiExclusive == 0)
	return 0;

      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(get_engine(rng));
    }

    /**
     * @brief In-place Fisher-Yates shuffle driven by get_random_index.
     *
     * std::shuffle is not used because its draw sequence is implementation
     * defined; this keeps seeded runs identical across standard libraries
     * as long as uniform_int_distribution agrees.
     */
    template <typename T, typename Rng>
    inline void shuffle(std::vector<T>& v, Rng& rng)
    {
      for (std::size_t i = v.size(); i > 1; --i)
	{
	  const std::size_t j = get_random_index(rng, i);
	  std::swap(v[i - 1], v[j]);
	}
    }

    inline std::uint64_t splitmix64(std::uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    inline std::uint64_t hash_combine64(std::initializer_list<std::uint64_t> parts)
    {
      std::uint64_t h = 0x6a09e667f3bcc909ull;
      for (auto v : parts)
	h = splitmix64(h ^ v);
      return h;
    }

    // Expands a 64-bit seed into eight 32-bit words for std::seed_seq.
    inline std::seed_seq make_seed_seq(std::uint64_t seed64)
    {
      const std::uint64_t s0 = seed64;
      const std::uint64_t s1 = splitmix64(s0);
      const std::uint64_t s2 = splitmix64(s0 ^ 0x9e3779b97f4a7c15ull);
      const std::uint64_t s3 = splitmix64(s1 + 0xd1342543de82ef95ull);

      std::array<std::uint32_t, 8> words = {
	static_cast<std::uint32_t>(s0), static_cast<std::uint32_t>(s0 >> 32),
	static_cast<std::uint32_t>(s1), static_cast<std::uint32_t>(s1 >> 32),
	static_cast<std::uint32_t>(s2), static_cast<std::uint32_t>(s2 >> 32),
	static_cast<std::uint32_t>(s3), static_cast<std::uint32_t>(s3 >> 32)
      };

      return std::seed_seq(words.begin(), words.end());
    }

    template<class Eng>
    inline Eng construct_seeded_engine(std::seed_seq& sseq)
    {
      if constexpr (std::is_constructible_v<Eng, std::seed_seq&>)
	{
	  return Eng(sseq);
	}
      else
	{
	  Eng e;
	  e.seed(sseq);
	  return e;
	}
    }

    template<class Eng>
    inline Eng make_seeded_engine(std::uint64_t seed64)
    {
      auto sseq = make_seed_seq(seed64);
      return construct_seeded_engine<Eng>(sseq);
    }

    /**
     * @brief Common-random-numbers key: a master seed plus opaque 64-bit tags.
     *
     * make_seed_for(i) is a pure function of (masterSeed, tags, i), so trial i
     * sees the same stream no matter which worker runs it.
     */
    class CRNKey
    {
    public:
      explicit CRNKey(std::uint64_t masterSeed, std::vector<std::uint64_t> tags = {})
	: mMasterSeed(masterSeed),
	  mTags(std::move(tags))
      {}

      CRNKey withTag(std::uint64_t tag) const
      {
	auto t = mTags;
	t.push_back(tag);
	return CRNKey(mMasterSeed, std::move(t));
      }

      std::uint64_t getMasterSeed() const noexcept
      {
	return mMasterSeed;
      }

      const std::vector<std::uint64_t>& getTags() const noexcept
      {
	return mTags;
      }

      std::uint64_t make_seed_for(std::size_t replicate) const
      {
	std::uint64_t h = mMasterSeed;
	for (auto v : mTags)
	  h = hash_combine64({h, v});
	return hash_combine64({h, static_cast<std::uint64_t>(replicate)});
      }

    private:
      std::uint64_t mMasterSeed;
      std::vector<std::uint64_t> mTags;
    };

    // Builds one engine per replicate index from a CRNKey.
    template<class Eng = std::mt19937_64>
    class CRNEngineProvider
    {
    public:
      using Engine = Eng;

      explicit CRNEngineProvider(CRNKey key)
	: mKey(std::move(key))
      {}

      CRNEngineProvider withTag(std::uint64_t tag) const
      {
	return CRNEngineProvider(mKey.withTag(tag));
      }

      Engine make_engine(std::size_t replicate) const
      {
	return make_seeded_engine<Engine>(mKey.make_seed_for(replicate));
      }

      const CRNKey& getKey() const noexcept
      {
	return mKey;
      }

    private:
      CRNKey mKey;
    };
  } // namespace rng_utils
} // namespace mcsig
