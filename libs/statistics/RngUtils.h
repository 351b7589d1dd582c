#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <random>
#include <array>
#include <vector>
#include <utility>
#include <initializer_list>

namespace effectsizes
{
  namespace rng_utils
  {

    // --- Detection: does Rng have .engine()? (e.g., randutils::mt19937_rng) ---
    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>> : std::true_type {};

    // Underlying engine of a randutils wrapper, or the engine itself.
    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
	return rng.engine();
      else
	return rng;
    }

    // Raw 64-bit draw, used to seed per-replicate engines.
    template <typename Rng>
    inline std::uint64_t get_random_value(Rng& rng)
    {
      return static_cast<std::uint64_t>(get_engine(rng)());
    }

    /**
     * @brief Uniform index in [0, hiExclusive).
     *
     * std::uniform_int_distribution on the underlying engine, so there is no
     * modulo bias whatever the engine's word size.
     *
     * @pre hiExclusive > 0 (callers validate; 0 maps to 0).
     */
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t hiExclusive)
    {
      if (hiExclusive == 0)
	return 0;

      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(get_engine(rng));
    }

    // SplitMix64 finalizer
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
      for (auto v : parts) h = splitmix64(h ^ v);
      return h;
    }

    /**
     * @brief Expands a 64-bit seed into an eight-word std::seed_seq.
     *
     * Seeding a Mersenne Twister from a single 32/64-bit value leaves most of
     * its state correlated across nearby seeds; diversifying through
     * SplitMix64 first keeps replicate engines seeded with consecutive values
     * statistically independent.
     */
    inline std::seed_seq make_seed_seq(std::uint64_t seed64)
    {
      const std::uint64_t s0 = seed64;
      const std::uint64_t s1 = splitmix64(s0);
      const std::uint64_t s2 = splitmix64(s0 ^ 0x9e3779b97f4a7c15ull);
      const std::uint64_t s3 = splitmix64(s1 + 0xd1342543de82ef95ull);

      const std::array<std::uint32_t, 8> words = {
	static_cast<std::uint32_t>(s0), static_cast<std::uint32_t>(s0 >> 32),
	static_cast<std::uint32_t>(s1), static_cast<std::uint32_t>(s1 >> 32),
	static_cast<std::uint32_t>(s2), static_cast<std::uint32_t>(s2 >> 32),
	static_cast<std::uint32_t>(s3), static_cast<std::uint32_t>(s3 >> 32)
      };

      return std::seed_seq(words.begin(), words.end());
    }

    // Engine from a seed_seq, for both std engines and randutils wrappers.
    template <class Eng>
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

    // Fresh engine seeded by one draw from a parent generator.
    template <class Eng, class Parent>
    inline Eng derive_engine(Parent& parent)
    {
      auto sseq = make_seed_seq(get_random_value(parent));
      return construct_seeded_engine<Eng>(sseq);
    }

    /**
     * @brief Master seed plus an immutable list of 64-bit tags.
     *
     * Tags name the stream (for example which effect size or which sample
     * pair is being bootstrapped); the replicate index is mixed in last.
     */
    class CRNKey
    {
    public:
      explicit CRNKey(std::uint64_t masterSeed, std::vector<std::uint64_t> tags = {})
	: m_masterSeed(masterSeed), m_tags(std::move(tags))
      {}

      CRNKey with_tag(std::uint64_t tag) const
      {
	auto t = m_tags;
	t.push_back(tag);
	return CRNKey(m_masterSeed, std::move(t));
      }

      std::uint64_t masterSeed() const noexcept
      {
	return m_masterSeed;
      }

      const std::vector<std::uint64_t>& tags() const noexcept
      {
	return m_tags;
      }

      std::uint64_t make_seed_for(std::size_t replicate) const
      {
	std::uint64_t h = m_masterSeed;
	for (auto v : m_tags) h = hash_combine64({h, v});
	return hash_combine64({h, static_cast<std::uint64_t>(replicate)});
      }

    private:
      std::uint64_t              m_masterSeed;
      std::vector<std::uint64_t> m_tags;
    };

    /**
     * @brief Common-random-numbers engine provider.
     *
     * make_engine(b) depends only on the key and b, so replicate b sees the
     * same stream whatever order replicates are evaluated in, and two
     * bootstraps sharing a key resample with identical index streams.
     */
    template <class Eng = std::mt19937_64>
    class CRNRng
    {
    public:
      using Engine = Eng;

      explicit CRNRng(CRNKey key)
	: m_key(std::move(key))
      {}

      CRNRng with_tag(std::uint64_t tag) const
      {
	return CRNRng(m_key.with_tag(tag));
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
} // namespace effectsizes
