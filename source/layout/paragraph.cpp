// paragraph.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "layout/line.h"

namespace folio::layout
{
	namespace
	{
		struct Word
		{
			std::vector<Glyph> glyphs;

			// the space between this word and the previous one, if there was a previous one
			std::optional<Glyph> separator;
		};

		struct Words
		{
			std::vector<Style> styles;
			std::vector<Word> words;
		};
	}

	static std::string word_text(const Word& word)
	{
		std::u32string ret {};
		for(auto& g : word.glyphs)
			ret.push_back(g.codepoint);

		return unicode::stringFromU32String(ret);
	}

	/*
	    Words are runs of non-whitespace, and may span several runs of the paragraph. However much
	    whitespace there is between two words, it becomes one space, set in the style of the first
	    whitespace character.
	*/
	static Words split_words(const RenderContext& ctx, const Paragraph& para, const Style& parent_style)
	{
		Words ret {};

		Word current {};
		std::optional<Glyph> pending_space {};

		for(auto& run : para.runs())
		{
			auto style_idx = ret.styles.size();
			ret.styles.push_back(parent_style.extendWith(run.style));

			auto& style = ret.styles.back();
			auto text = unicode::u32StringFromUtf8(run.text);
			auto advances = ctx.fonts->measure(style, text);

			for(size_t i = 0; i < text.size(); i++)
			{
				if(unicode::isWhitespace(text[i]))
				{
					if(not current.glyphs.empty())
					{
						ret.words.push_back(std::move(current));
						current = Word {};
					}

					if(not ret.words.empty() && not pending_space.has_value())
					{
						auto space = ctx.fonts->measure(style, U" ");
						pending_space = Glyph { .codepoint = U' ', .style = style_idx, .advance = space[0] };
					}

					continue;
				}

				if(current.glyphs.empty())
				{
					current.separator = pending_space;
					pending_space.reset();
				}

				current.glyphs.push_back(Glyph { .codepoint = text[i], .style = style_idx, .advance = advances[i] });
			}
		}

		if(not current.glyphs.empty())
			ret.words.push_back(std::move(current));

		return ret;
	}

	ErrorOr<RenderResult> renderParagraph(const RenderContext& ctx,
	    const Paragraph& para,
	    Area area,
	    const Style& style,
	    const Continuation* resume)
	{
		auto [styles, words] = split_words(ctx, para, style);

		auto available = area.width();
		auto max_width = Length(0);

		size_t next = resume ? resume->index : 0;
		while(next < words.size())
		{
			auto line = LineBuilder(ctx, styles);

			size_t end = next;
			for(; end < words.size(); end++)
			{
				auto& word = words[end];
				auto mark = line.mark();

				if(not line.empty() && word.separator.has_value())
					line.add(*word.separator);

				for(auto& g : word.glyphs)
					line.add(g);

				if(available - line.width() >= Length(0))
					continue;

				if(line.mark() == word.glyphs.size())
				{
					return ErrLayout("word '{}' is too wide for the line ({.2f}mm > {.2f}mm)", word_text(word),
					    line.width().value(), available.value());
				}

				line.truncate(mark);
				break;
			}

			auto box = line.box();
			if(box.height > area.remainingHeight())
				return Ok(RenderResult::continued(Size2d(max_width, area.cursor()), Continuation { .index = next }));

			auto offset = alignmentOffset(para.alignment(), available, line.width());
			for(auto& run : line.runs())
				area.drawText(Position(offset + run.x, area.cursor() + box.ascent), run.run, styles[run.style]);

			area.advance(box.height);
			max_width = dim::max(max_width, line.width());
			next = end;
		}

		return Ok(RenderResult::complete(Size2d(max_width, area.cursor())));
	}
}
