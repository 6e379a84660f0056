// recording_backend.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "folio/recording_backend.h"

namespace folio
{
	template <typename T>
	static std::vector<const T*> commands_of_type(const std::vector<RecordingBackend::Command>& cmds)
	{
		std::vector<const T*> ret {};
		for(auto& cmd : cmds)
		{
			if(auto x = std::get_if<T>(&cmd); x != nullptr)
				ret.push_back(x);
		}

		return ret;
	}

	auto RecordingBackend::Page::texts() const -> std::vector<const TextCommand*>
	{
		return commands_of_type<TextCommand>(commands);
	}

	auto RecordingBackend::Page::lines() const -> std::vector<const LineCommand*>
	{
		return commands_of_type<LineCommand>(commands);
	}

	auto RecordingBackend::Page::rects() const -> std::vector<const RectCommand*>
	{
		return commands_of_type<RectCommand>(commands);
	}

	std::vector<std::string> RecordingBackend::Page::strings() const
	{
		return util::map(this->texts(), [](const TextCommand* cmd) { //
			return unicode::stringFromU32String(cmd->run.text());
		});
	}


	ErrorOr<void> RecordingBackend::beginPage(Size2d page_size)
	{
		if(m_finished)
			return ErrBackend("document was already finished");
		if(m_page_open)
			return ErrBackend("beginPage() called while page {} is still open", m_pages.size());

		m_pages.push_back(Page { .size = page_size, .commands = {} });
		m_page_open = true;

		return Ok();
	}

	void RecordingBackend::record(Command cmd)
	{
		if(not m_page_open)
		{
			if(not m_draw_error.has_value())
				m_draw_error = "draw command issued outside of a page";
			return;
		}

		m_pages.back().commands.push_back(std::move(cmd));
	}

	void RecordingBackend::drawText(Position baseline, const TextRun& run, const Style& style)
	{
		this->record(TextCommand { .baseline = baseline, .run = run, .style = style });
	}

	void RecordingBackend::drawLine(Position start, Position end, const LineStyle& line_style)
	{
		this->record(LineCommand { .start = start, .end = end, .line_style = line_style });
	}

	void RecordingBackend::drawRect(Position top_left, Size2d size, const Paint& paint)
	{
		this->record(RectCommand { .top_left = top_left, .size = size, .paint = paint });
	}

	ErrorOr<void> RecordingBackend::endPage()
	{
		if(not m_page_open)
			return ErrBackend("endPage() called without an open page");

		m_page_open = false;
		if(m_draw_error.has_value())
			return ErrBackend("{}", *m_draw_error);

		return Ok();
	}

	ErrorOr<zst::byte_buffer> RecordingBackend::finish()
	{
		if(m_finished)
			return ErrBackend("document was already finished");
		if(m_page_open)
			return ErrBackend("finish() called while page {} is still open", m_pages.size());
		if(m_draw_error.has_value())
			return ErrBackend("{}", *m_draw_error);

		m_finished = true;

		std::string out {};
		for(size_t i = 0; i < m_pages.size(); i++)
		{
			auto& page = m_pages[i];
			out += zpr::sprint("page {} ({.3f} x {.3f})\n", i + 1, page.size.x().value(), page.size.y().value());

			for(auto& cmd : page.commands)
			{
				std::visit(util::overloaded {
				               [&out](const TextCommand& t) {
					               out += zpr::sprint("  text ({.3f}, {.3f}) {.2f}pt '{}'\n", t.baseline.x().value(),
					                   t.baseline.y().value(), t.style.font_size(), t.run.text());
				               },
				               [&out](const LineCommand& l) {
					               out += zpr::sprint("  line ({.3f}, {.3f}) -> ({.3f}, {.3f})\n", l.start.x().value(),
					                   l.start.y().value(), l.end.x().value(), l.end.y().value());
				               },
				               [&out](const RectCommand& r) {
					               out += zpr::sprint("  rect ({.3f}, {.3f}) {.3f} x {.3f}{}{}\n", r.top_left.x().value(),
					                   r.top_left.y().value(), r.size.x().value(), r.size.y().value(),
					                   r.paint.fill.has_value() ? " fill" : "", r.paint.stroke.has_value() ? " stroke" : "");
				               },
				           },
				    cmd);
			}
		}

		zst::byte_buffer buf {};
		buf.append(reinterpret_cast<const uint8_t*>(out.data()), out.size());

		return Ok(std::move(buf));
	}
}
