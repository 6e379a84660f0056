// tester.h
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "defs.h"

#include "folio.h"
#include "layout/base.h"

namespace test
{
	struct Context
	{
		size_t passed;
		size_t failed;
		size_t skipped;

		// the name of the test currently running, for failure messages
		const char* current = "";
	};

	void test_style(Context& ctx);
	void test_fonts(Context& ctx);
	void test_paragraph(Context& ctx);
	void test_layout(Context& ctx);
	void test_table(Context& ctx);
	void test_frame(Context& ctx);
	void test_document(Context& ctx);
	void test_pdf(Context& ctx);




	/*
	    A font where every glyph is 500 units wide (on a 1000-unit em), with an ascent of 800 and a
	    descent of 200, so one line at size S is exactly S points tall. The only kerning pair is
	    "AV", which is tightened by 100 units.
	*/
	struct FakeFont : font::FontSource
	{
		explicit FakeFont(std::string name, double advance = 500);

		virtual double glyphAdvance(char32_t codepoint) const override;
		virtual double kerningAdjustment(char32_t left, char32_t right) const override;
		virtual bool hasGlyph(char32_t codepoint) const override;

	private:
		double m_advance;
	};

	// the bold faces are 600 units wide, so that style changes show up in measurements
	struct FakeFontBackend : folio::FontBackend
	{
		FakeFontBackend();

		virtual folio::ErrorOr<folio::FontFamily> resolveFamily(zst::str_view name) override;

		folio::FontFamily family() const;

		// the root style that documents using this backend get; 10pt, single spaced
		folio::Style rootStyle() const;

		// how wide `n` glyphs of the regular face are at the given size
		static folio::Length advance(size_t n, double font_size = 10);
		static folio::Length lineHeight(double font_size = 10);

	private:
		FakeFont m_regular;
		FakeFont m_italic;
		FakeFont m_bold;
		FakeFont m_bold_italic;
	};

	// renders one element onto a single recorded page of the given size
	struct PageFixture
	{
		PageFixture(folio::Size2d page_size);

		folio::ErrorOr<folio::layout::RenderResult> render(const folio::Element& element,
		    const folio::layout::Continuation* resume = nullptr);

		FakeFontBackend fonts;
		folio::RecordingBackend backend;
		folio::Size2d page_size;
	};



	// helpers and stuff
	inline bool approx(double a, double b, double eps = 1e-6)
	{
		return std::abs(a - b) <= eps;
	}

	inline bool approx(folio::Length a, folio::Length b, double eps = 1e-6)
	{
		return approx(a.value(), b.value(), eps);
	}

	template <typename... Args>
	inline bool check(Context& ctx, bool cond, const char* fmt, Args&&... args)
	{
		if(cond)
		{
			ctx.passed++;
		}
		else
		{
			ctx.failed++;
			zpr::println("    FAIL ({}): {}", ctx.current, zpr::fwd(fmt, static_cast<Args&&>(args)...));
		}

		return cond;
	}

	template <typename T>
	inline bool check_ok(Context& ctx, const folio::ErrorOr<T>& result, const char* what)
	{
		if(result.ok())
			return check(ctx, true, "{}", what);

		return check(ctx, false, "{}: {}", what, result.error().string());
	}

	template <typename T>
	inline bool check_err(Context& ctx, const folio::ErrorOr<T>& result, folio::Error::Kind kind, const char* what)
	{
		if(result.ok())
			return check(ctx, false, "{}: expected an error", what);

		return check(ctx, result.error().kind() == kind, "{}: wrong kind of error ({})", what,
		    result.error().string());
	}

	inline void begin(Context& ctx, const char* name)
	{
		ctx.current = name;
		zpr::println("  {}", name);
	}
}
