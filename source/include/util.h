// util.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <bit>
#include <limits>
#include <memory>
#include <cstring>
#include <concepts>
#include <optional>
#include <string_view>

#include <zpr.h>
#include <zst/zst.h>

#include <xxhash.h>
#include <ankerl/unordered_dense.h>

namespace util
{
	template <typename... Xs>
	struct overloaded : Xs...
	{
		using Xs::operator()...;
	};

	template <typename... Xs>
	overloaded(Xs...) -> overloaded<Xs...>;

	template <typename T, std::equality_comparable_with<T>... Ts>
	static constexpr bool is_one_of(T foo, Ts... foos)
	{
		return (false || ... || (foo == foos));
	}

	/*
	    Returns the contents of the file, or nothing if it could not be opened or read. Callers
	    decide whether a missing file is an error (it usually is not, eg. when probing font directories).
	*/
	std::optional<zst::byte_buffer> readEntireFile(const std::string& path);
	bool writeEntireFile(const std::string& path, zst::byte_span contents);


	// clang-format off
	template <typename A>
	concept has_hash_method = requires(A a)
	{
		{ a.hash() } -> std::same_as<size_t>;
	};

	template <typename A>
	concept has_hash_specialisation = requires(A a)
	{
		{ std::hash<A>{}(a) } -> std::same_as<size_t>;
	};
	// clang-format on

	struct hasher
	{
		using is_transparent = void;

		static constexpr uint64_t SEED = 0xe575ed3ae41ead6dull;
		size_t operator()(const char* str) const { return XXH64(str, strlen(str), SEED); }
		size_t operator()(zst::str_view str) const { return XXH64(str.data(), str.size(), SEED); }
		size_t operator()(std::string_view str) const { return XXH64(str.data(), str.size(), SEED); }
		size_t operator()(const std::string& str) const { return XXH64(str.data(), str.size(), SEED); }

		size_t operator()(std::u32string_view str) const
		{
			return XXH64(str.data(), str.size() * sizeof(char32_t), SEED);
		}

		template <has_hash_method T>
		    requires(not has_hash_specialisation<T>)
		size_t operator()(const T& x) const
		{
			return x.hash();
		}

		template <has_hash_specialisation T>
		size_t operator()(const T& a) const
		{
			return std::hash<std::remove_cvref_t<decltype(a)>>()(a);
		}

		template <typename A, typename B>
		size_t operator()(const std::pair<A, B>& p) const
		{
			return combine(0, p.first, p.second);
		}

		template <typename... Ts>
		static size_t combine(size_t seed, Ts&&... vs)
		{
			auto xorshift = [](size_t x, int i) -> size_t { return x ^ (x >> i); };

			auto distribute = [&xorshift](uint64_t n) -> uint64_t {
				uint64_t p = 0x5555555555555555ull;   // pattern of alternating 0 and 1
				uint64_t c = 17316035218449499591ull; // random uneven integer constant;
				return c * xorshift(p * xorshift(n, 32), 32);
			};

			return (std::rotl(seed, std::numeric_limits<size_t>::digits / 3) ^ ... ^ distribute(hasher()(vs)));
		}
	};

	template <typename K, typename V, typename H = hasher, typename E = std::equal_to<>>
	using hashmap = ankerl::unordered_dense::map<K, V, H, E>;

	template <typename T, typename H = hasher, typename E = std::equal_to<>>
	using hashset = ankerl::unordered_dense::set<T, H, E>;


	namespace impl
	{
		template <typename T, typename E>
		struct extract_value_or_return_void
		{
			T extract(zst::Result<T, E>& result) { return std::move(result.unwrap()); }
		};

		template <typename E>
		struct extract_value_or_return_void<void, E>
		{
			void extract([[maybe_unused]] zst::Result<void, E>& result) { }
		};
	}

	template <typename T, typename Fn>
	auto map(const std::vector<T>& xs, Fn&& fn)
	{
		std::vector<decltype(fn(std::declval<T>()))> ret {};
		ret.reserve(xs.size());

		for(auto& x : xs)
			ret.push_back(fn(x));

		return ret;
	}
}

namespace unicode
{
	std::string utf8FromCodepoint(char32_t cp);

	std::u32string u32StringFromUtf8(std::string_view sv);
	std::string stringFromU32String(std::u32string_view sv);

	// space separators plus tab, newline and carriage return
	bool isWhitespace(char32_t cp);
}

namespace zpr
{
	template <>
	struct print_formatter<std::u32string>
	{
		template <typename Cb>
		void print(const std::u32string& x, Cb&& cb, format_args args)
		{
			auto s = unicode::stringFromU32String(x);
			detail::print_one(static_cast<Cb&&>(cb), std::move(args), std::move(s));
		}
	};
}
