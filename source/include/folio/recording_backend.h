// recording_backend.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <variant>

#include "folio/render_backend.h"

namespace folio
{
	/*
	    A backend that just remembers what it was asked to draw. `finish` produces a plain-text
	    listing of the commands, one per line, which is handy for debugging layouts.
	*/
	struct RecordingBackend : RenderBackend
	{
		struct TextCommand
		{
			Position baseline;
			TextRun run;
			Style style;
		};

		struct LineCommand
		{
			Position start;
			Position end;
			LineStyle line_style;
		};

		struct RectCommand
		{
			Position top_left;
			Size2d size;
			Paint paint;
		};

		using Command = std::variant<TextCommand, LineCommand, RectCommand>;

		struct Page
		{
			Size2d size;
			std::vector<Command> commands;

			std::vector<const TextCommand*> texts() const;
			std::vector<const LineCommand*> lines() const;
			std::vector<const RectCommand*> rects() const;

			// the text of each text command, in drawing order
			std::vector<std::string> strings() const;
		};

		virtual ErrorOr<void> beginPage(Size2d page_size) override;

		virtual void drawText(Position baseline, const TextRun& run, const Style& style) override;
		virtual void drawLine(Position start, Position end, const LineStyle& line_style) override;
		virtual void drawRect(Position top_left, Size2d size, const Paint& paint) override;

		virtual ErrorOr<void> endPage() override;
		virtual ErrorOr<zst::byte_buffer> finish() override;

		const std::vector<Page>& pages() const { return m_pages; }
		bool isFinished() const { return m_finished; }

	private:
		void record(Command cmd);

		std::vector<Page> m_pages;
		std::optional<std::string> m_draw_error;
		bool m_page_open = false;
		bool m_finished = false;
	};
}
