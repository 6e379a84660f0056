// line.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "layout/line.h"

namespace folio::layout
{
	LineBuilder::LineBuilder(const RenderContext& ctx, const std::vector<Style>& styles) : m_ctx(ctx), m_styles(styles)
	{
	}

	static bool can_kern(const Style& a, const Style& b)
	{
		return a.font() == b.font() && a.font_size() == b.font_size();
	}

	void LineBuilder::add(const Glyph& glyph)
	{
		auto x = this->width();
		if(not m_glyphs.empty())
		{
			auto& prev = m_glyphs.back().glyph;
			auto& prev_style = m_styles[prev.style];
			auto& cur_style = m_styles[glyph.style];

			if(can_kern(prev_style, cur_style))
				x += m_ctx.fonts->kerning(cur_style, prev.codepoint, glyph.codepoint);
		}

		m_glyphs.push_back(PlacedGlyph { .glyph = glyph, .x = x });
	}

	void LineBuilder::truncate(size_t mark)
	{
		if(mark < m_glyphs.size())
			m_glyphs.erase(m_glyphs.begin() + static_cast<ptrdiff_t>(mark), m_glyphs.end());
	}

	Length LineBuilder::width() const
	{
		if(m_glyphs.empty())
			return Length(0);

		return m_glyphs.back().x + m_glyphs.back().glyph.advance;
	}

	std::vector<LineRun> LineBuilder::runs() const
	{
		std::vector<LineRun> runs {};
		for(auto& g : m_glyphs)
		{
			if(runs.empty() || m_styles[runs.back().style] != m_styles[g.glyph.style])
			{
				runs.push_back(LineRun {
				    .style = g.glyph.style,
				    .x = g.x,
				    .run = TextRun {},
				});
			}

			auto& run = runs.back();
			run.run.glyphs.push_back(PositionedGlyph {
			    .codepoint = g.glyph.codepoint,
			    .x = g.x - run.x,
			    .advance = g.glyph.advance,
			});
			run.run.width = g.x + g.glyph.advance - run.x;
		}

		return runs;
	}

	/*
	    Mixed styles on one line: the line is as tall as its tallest ascent plus its deepest
	    descent, scaled by the largest line spacing, and every glyph sits on the same baseline.
	*/
	LineBox LineBuilder::box() const
	{
		Length ascent {};
		Length descent {};
		double spacing = 0;

		auto consider = [&](const Style& style) {
			auto metrics = m_ctx.fonts->lineMetrics(style);
			ascent = dim::max(ascent, metrics.ascent);
			descent = dim::max(descent, metrics.descent);
			spacing = std::max(spacing, style.line_spacing());
		};

		if(m_glyphs.empty())
			consider(m_styles[0]);

		for(auto& g : m_glyphs)
			consider(m_styles[g.glyph.style]);

		return LineBox {
			.ascent = ascent,
			.height = (ascent + descent) * spacing,
		};
	}

	Length alignmentOffset(Alignment alignment, Length available, Length line_width)
	{
		switch(alignment)
		{
			case Alignment::Left: return Length(0);
			case Alignment::Centre: return (available - line_width) / 2;
			case Alignment::Right: return available - line_width;
		}
		return Length(0);
	}
}
