// fake_font.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

namespace test
{
	FakeFont::FakeFont(std::string name, double advance) : m_advance(advance)
	{
		m_name = std::move(name);

		m_metrics.units_per_em = 1000;
		m_metrics.ascent = 800;
		m_metrics.descent = -200;
		m_metrics.cap_height = 700;
		m_metrics.x_height = 500;
		m_metrics.xmin = 0;
		m_metrics.ymin = -200;
		m_metrics.xmax = advance;
		m_metrics.ymax = 800;
		m_metrics.is_fixed_pitch = true;
	}

	double FakeFont::glyphAdvance([[maybe_unused]] char32_t codepoint) const
	{
		return m_advance;
	}

	double FakeFont::kerningAdjustment(char32_t left, char32_t right) const
	{
		if(left == U'A' && right == U'V')
			return -100;

		return 0;
	}

	bool FakeFont::hasGlyph([[maybe_unused]] char32_t codepoint) const
	{
		return true;
	}


	FakeFontBackend::FakeFontBackend()
	    : m_regular("Fake-Regular")
	    , m_italic("Fake-Italic")
	    , m_bold("Fake-Bold", 600)
	    , m_bold_italic("Fake-BoldItalic", 600)
	{
	}

	folio::FontFamily FakeFontBackend::family() const
	{
		return folio::FontFamily(&m_regular, &m_italic, &m_bold, &m_bold_italic);
	}

	folio::ErrorOr<folio::FontFamily> FakeFontBackend::resolveFamily(zst::str_view name)
	{
		if(name == "Fake" || name == "Helvetica")
			return folio::Ok(this->family());

		return folio::ErrConfig("no font family named '{}'", name);
	}

	folio::Style FakeFontBackend::rootStyle() const
	{
		return folio::Style()
		    .with_font_family(this->family())
		    .with_font_size(10)
		    .with_line_spacing(1)
		    .with_colour(folio::Colour::black())
		    .with_bold(false)
		    .with_italic(false);
	}

	folio::Length FakeFontBackend::advance(size_t n, double font_size)
	{
		return folio::pointsToLength(font_size * 0.5) * static_cast<double>(n);
	}

	folio::Length FakeFontBackend::lineHeight(double font_size)
	{
		return folio::pointsToLength(font_size);
	}


	PageFixture::PageFixture(folio::Size2d size) : page_size(size)
	{
	}

	folio::ErrorOr<folio::layout::RenderResult> PageFixture::render(const folio::Element& element,
	    const folio::layout::Continuation* resume)
	{
		TRY(backend.beginPage(page_size));

		auto ctx = folio::layout::RenderContext { .fonts = &fonts };
		auto area = folio::Area(&backend, folio::Position(0, 0), page_size);

		auto result = TRY(folio::layout::render(ctx, element, area, fonts.rootStyle(), resume));
		TRY(backend.endPage());

		return folio::Ok(std::move(result));
	}
}
