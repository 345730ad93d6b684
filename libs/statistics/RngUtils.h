// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <random>
#include <array>
#include <vector>
#include <utility>
#include <initializer_list>

namespace triagesim
{
  namespace rng_utils
  {
    /**
     * @brief Get a random index in [0, hiExclusive).
     *
     * Uses std::uniform_int_distribution on the engine to avoid modulo bias.
     *
     * @pre hiExclusive > 0
     */
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t hiExclusive)
    {
      if (hiExclusive == 0)
	return 0;

      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(rng);
    }

    /**
     * @brief Get a double strictly in [0, 1).
     *
     * The top 53 bits of one 64-bit engine output are scaled by 2^-53, so the
     * largest value returned is 1 - 2^-53. std::uniform_real_distribution can
     * round up to 1.0 on some standard libraries, which would let a tie-break
     * draw spill into the next priority tier.
     */
    template <typename Rng>
    inline double get_random_uniform_01(Rng& rng)
    {
      static_assert(Rng::max() - Rng::min() == 0xffffffffffffffffull,
		    "get_random_uniform_01 requires a full 64-bit engine");

      const std::uint64_t bits = static_cast<std::uint64_t>(rng() - Rng::min());
      return static_cast<double>(bits >> 11) * 0x1.0p-53;
    }

    // Simple 64-bit splitmix hash (deterministic, good avalanche)
    inline uint64_t splitmix64(uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    // Combine several 64-bit values into one seed
    inline uint64_t hash_combine64(std::initializer_list<uint64_t> parts)
    {
      uint64_t h = 0x6a09e667f3bcc909ull;
      for (auto v : parts)
	h = splitmix64(h ^ v);
      return h;
    }

    /**
     * @brief Master seed plus an ordered list of 64-bit tags naming a stream.
     *
     * Two keys with the same seed and the same tags always derive the same
     * per-replicate seeds; any difference in the tags gives unrelated streams.
     */
    class CRNKey
    {
    public:
      explicit CRNKey(uint64_t masterSeed, std::vector<uint64_t> tags = {})
	: m_masterSeed(masterSeed), m_tags(std::move(tags))
      {}

      CRNKey with_tag(uint64_t tag) const
      {
	auto t = m_tags;
	t.push_back(tag);
	return CRNKey(m_masterSeed, std::move(t));
      }

      CRNKey with_tags(std::initializer_list<uint64_t> tags) const
      {
	auto t = m_tags;
	t.insert(t.end(), tags.begin(), tags.end());
	return CRNKey(m_masterSeed, std::move(t));
      }

      uint64_t masterSeed() const noexcept
      {
	return m_masterSeed;
      }

      const std::vector<uint64_t>& tags() const noexcept
      {
	return m_tags;
      }

      // The replicate index is hashed in as the last tag.
      uint64_t make_seed_for(std::size_t replicate) const
      {
	uint64_t h = m_masterSeed;
	for (auto v : m_tags)
	  h = hash_combine64({h, v});
	return hash_combine64({h, static_cast<uint64_t>(replicate)});
      }

    private:
      uint64_t m_masterSeed;
      std::vector<uint64_t> m_tags;
    };

    // Expand a 64-bit seed into eight 32-bit words using diversified SplitMix64
    inline std::seed_seq make_seed_seq(uint64_t seed64)
    {
      const uint64_t s0 = seed64;
      const uint64_t s1 = splitmix64(s0);
      const uint64_t s2 = splitmix64(s0 ^ 0x9e3779b97f4a7c15ull);
      const uint64_t s3 = splitmix64(s0 + 0xd1342543de82ef95ull);
      const uint64_t s4 = splitmix64(s1 ^ 0x94d049bb133111ebull);
      const uint64_t s5 = splitmix64(s2 + 0xbf58476d1ce4e5b9ull);
      const uint64_t s6 = splitmix64(s3 ^ 0x6a09e667f3bcc909ull);
      const uint64_t s7 = splitmix64(s4 + 0x243f6a8885a308d3ull);

      const uint64_t mix = (s3 ^ s5 ^ s6 ^ s7);

      std::array<uint32_t, 8> words = {
	static_cast<uint32_t>(s0), static_cast<uint32_t>(s0 >> 32),
	static_cast<uint32_t>(s1), static_cast<uint32_t>(s1 >> 32),
	static_cast<uint32_t>(s2), static_cast<uint32_t>(s2 >> 32),
	static_cast<uint32_t>(mix), static_cast<uint32_t>(mix >> 32)
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

    /**
     * @brief Builds deterministically seeded engines from a CRNKey.
     *
     * make_engine(r) depends only on the key and r, never on how many engines
     * were made before or on which thread asks, which is what keeps parallel
     * replicate runs bit-identical to sequential ones.
     */
    template<class Eng = std::mt19937_64>
    class CRNRng
    {
    public:
      using Engine = Eng;

      explicit CRNRng(CRNKey key)
	: m_key(std::move(key))
      {}

      CRNRng with_tag(uint64_t tag) const
      {
	return CRNRng(m_key.with_tag(tag));
      }

      CRNRng with_tags(std::initializer_list<uint64_t> tags) const
      {
	return CRNRng(m_key.with_tags(tags));
      }

      Engine make_engine(std::size_t replicate) const
      {
	auto sseq = make_seed_seq(m_key.make_seed_for(replicate));
	return construct_seeded_engine<Engine>(sseq);
      }

      const CRNKey& key() const noexcept
      {
	return m_key;
      }

    private:
      CRNKey m_key;
    };
  } // namespace rng_utils
} // namespace triagesim
