// table.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <cmath>

#include "layout/base.h"

namespace folio::layout
{
	static Length sum_left_to_right(const std::vector<Length>& xs)
	{
		auto ret = Length(0);
		for(auto x : xs)
			ret += x;

		return ret;
	}

	ErrorOr<std::vector<Length>> computeColumnWidths(const std::vector<double>& weights, Length available)
	{
		if(weights.empty())
			return ErrLayout("table has no columns");

		double total = 0;
		for(auto w : weights)
		{
			if(not std::isfinite(w) || w <= 0)
				return ErrLayout("column weight {} is not positive", w);

			total += w;
		}

		if(not std::isfinite(total) || total <= 0)
			return ErrLayout("column weights do not have a positive sum");

		std::vector<Length> widths {};
		widths.reserve(weights.size());

		for(size_t i = 0; i + 1 < weights.size(); i++)
			widths.push_back(available * (weights[i] / total));

		widths.push_back(available - sum_left_to_right(widths));

		// the subtraction above can still be off by an ulp or so after the widths are added
		// back up; nudge the last column until the sum comes out exact.
		auto& last = widths.back();
		for(int i = 0; i < 64; i++)
		{
			auto sum = sum_left_to_right(widths);
			if(sum == available)
				break;

			auto target = std::numeric_limits<double>::infinity() * (sum < available ? 1 : -1);
			last = Length(std::nextafter(last.value(), target));
		}

		return Ok(std::move(widths));
	}


	namespace
	{
		struct CellState
		{
			const Continuation* resume = nullptr;
			bool finished = false;
			bool continued = false;

			Margins padding {};
		};
	}

	// an empty cell that completes without placing anything does not count; otherwise a row
	// could be "split" at the bottom of a page without any of its content being placed.
	static bool made_progress(const CellState& cell, const RenderResult& result)
	{
		if(result.isComplete())
			return cell.resume != nullptr || result.size.y() > Length(0);

		if(cell.resume == nullptr)
			return not result.continuation->isStart();

		return *result.continuation != *cell.resume;
	}

	ErrorOr<RenderResult> renderTableLayout(const RenderContext& ctx,
	    const TableLayout& table,
	    Area area,
	    const Style& style,
	    const Continuation* resume)
	{
		auto widths = TRY(computeColumnWidths(table.weights(), area.width()));

		auto& rows = table.rows();
		auto decorator = table.cellDecorator();
		auto num_cols = table.numColumns();

		auto make_info = [&](size_t col, size_t row) {
			return CellInfo {
				.column = col,
				.row = row,
				.num_columns = num_cols,
				.num_rows = rows.size(),
				.continues = false,
				.continued = false,
			};
		};

		size_t start = resume ? resume->index : 0;
		for(size_t r = start; r < rows.size(); r++)
		{
			auto& row = rows[r];
			auto available = area.remainingHeight();

			// only the row we stopped at can have been split
			bool split_row = (r == start && resume != nullptr && resume->nested.size() == num_cols);

			std::vector<CellState> cells(num_cols);
			for(size_t c = 0; c < num_cols; c++)
			{
				if(not split_row)
					continue;

				auto& cont = resume->nested[c];
				cells[c].finished = cont.finished;
				cells[c].continued = true;
				cells[c].resume = cont.finished ? nullptr : resumeOf(cont);
			}

			// first pass: measure without drawing, so we know how tall the row is.
			auto row_height = Length(0);
			bool any_progress = false;
			bool any_continues = false;

			auto x = Length(0);
			for(size_t c = 0; c < num_cols; c++)
			{
				auto& cell = cells[c];
				auto col_x = x;
				x += widths[c];

				if(cell.finished)
					continue;

				auto info = make_info(c, r);
				info.continued = cell.continued;

				cell.padding = decorator ? decorator->cellPadding(info) : Margins {};

				auto cell_area = area.column(col_x, widths[c]).measuring().shrink(cell.padding);
				auto result = TRY(render(ctx, row.cells[c], cell_area, style, cell.resume));

				any_progress |= made_progress(cell, result);
				any_continues |= not result.isComplete();

				row_height = dim::max(row_height, result.size.y() + cell.padding.vertical());
			}

			row_height = dim::min(row_height, available);

			if(not any_progress && any_continues)
			{
				auto cont = Continuation { .index = r };
				if(split_row)
					cont.nested = resume->nested;

				return Ok(RenderResult::continued(Size2d(area.width(), area.cursor()), std::move(cont)));
			}

			// second pass: draw for real.
			if(row.background.has_value())
				area.drawRect(Position(Length(0), area.cursor()), Size2d(area.width(), row_height), Paint::filled(*row.background));

			std::vector<Continuation> nested {};
			x = Length(0);

			for(size_t c = 0; c < num_cols; c++)
			{
				auto& cell = cells[c];
				auto col_x = x;
				x += widths[c];

				auto col_area = area.column(col_x, widths[c]);
				auto info = make_info(c, r);
				info.continued = cell.continued;

				bool complete = true;
				if(not cell.finished)
				{
					auto result = TRY(render(ctx, row.cells[c], col_area.shrink(cell.padding), style, cell.resume));
					complete = result.isComplete();

					if(complete)
						nested.push_back(Continuation { .finished = true });
					else
						nested.push_back(std::move(*result.continuation));
				}
				else
				{
					nested.push_back(Continuation { .finished = true });
				}

				info.continues = not complete;
				if(decorator != nullptr)
					decorator->decorateCell(info, col_area.withHeight(row_height), row_height);
			}

			area.advance(row_height);

			if(any_continues)
			{
				return Ok(RenderResult::continued(Size2d(area.width(), area.cursor()),
				    Continuation { .index = r, .finished = false, .nested = std::move(nested) }));
			}
		}

		return Ok(RenderResult::complete(Size2d(area.width(), area.cursor())));
	}
}
