// element.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "folio/element.h"

namespace folio
{
	Text::Text(std::string text, Style style) : m_string { .text = std::move(text), .style = std::move(style) }
	{
	}

	Paragraph::Paragraph(std::string text, Style style)
	{
		this->pushStyled(std::move(text), std::move(style));
	}

	Paragraph& Paragraph::push(std::string text)
	{
		return this->pushStyled(std::move(text), Style());
	}

	Paragraph& Paragraph::pushStyled(std::string text, Style style)
	{
		m_runs.push_back(StyledString { .text = std::move(text), .style = std::move(style) });
		return *this;
	}

	Paragraph& Paragraph::setAlignment(Alignment alignment)
	{
		m_alignment = alignment;
		return *this;
	}

	Paragraph Paragraph::aligned(Alignment alignment) const
	{
		auto copy = *this;
		copy.setAlignment(alignment);
		return copy;
	}


	LinearLayout::LinearLayout() = default;
	LinearLayout::~LinearLayout() = default;
	LinearLayout::LinearLayout(LinearLayout&&) = default;
	LinearLayout& LinearLayout::operator=(LinearLayout&&) = default;

	LinearLayout& LinearLayout::push(Element element)
	{
		m_children.push_back(std::move(element));
		return *this;
	}


	TableLayoutRow::TableLayoutRow(TableLayout* table) : m_table(table)
	{
	}

	TableLayoutRow& TableLayoutRow::element(Element element)
	{
		m_cells.push_back(std::move(element));
		return *this;
	}

	TableLayoutRow& TableLayoutRow::background(Colour colour)
	{
		m_background = colour;
		return *this;
	}

	ErrorOr<void> TableLayoutRow::push()
	{
		return m_table->pushRow(std::move(m_cells), m_background);
	}

	TableLayout::TableLayout(std::vector<double> column_weights) : m_weights(std::move(column_weights))
	{
	}

	TableLayout::~TableLayout() = default;
	TableLayout::TableLayout(TableLayout&&) = default;
	TableLayout& TableLayout::operator=(TableLayout&&) = default;

	TableLayoutRow TableLayout::row()
	{
		return TableLayoutRow(this);
	}

	ErrorOr<void> TableLayout::pushRow(std::vector<Element> cells, std::optional<Colour> background)
	{
		if(cells.size() != m_weights.size())
		{
			return ErrLayout("table row has {} cell{}, but the table has {} column{}", cells.size(),
			    cells.size() == 1 ? "" : "s", m_weights.size(), m_weights.size() == 1 ? "" : "s");
		}

		m_rows.push_back(TableRow { .cells = std::move(cells), .background = background });
		return Ok();
	}

	void TableLayout::setCellDecorator(std::unique_ptr<CellDecorator> decorator)
	{
		m_decorator = std::move(decorator);
	}


	Styled::Styled(Element child, Style style)
	    : m_child(std::make_unique<Element>(std::move(child)))
	    , m_style(std::move(style))
	{
	}

	Styled::~Styled() = default;
	Styled::Styled(Styled&&) = default;
	Styled& Styled::operator=(Styled&&) = default;

	Framed::Framed(Element child, LineStyle line_style)
	    : m_child(std::make_unique<Element>(std::move(child)))
	    , m_line_style(line_style)
	{
	}

	Framed::~Framed() = default;
	Framed::Framed(Framed&&) = default;
	Framed& Framed::operator=(Framed&&) = default;

	Padded::Padded(Element child, Margins margins)
	    : m_child(std::make_unique<Element>(std::move(child)))
	    , m_margins(margins)
	{
	}

	Padded::~Padded() = default;
	Padded::Padded(Padded&&) = default;
	Padded& Padded::operator=(Padded&&) = default;


	const char* Element::kindName() const
	{
		return std::visit(util::overloaded {
		                      [](const Text&) { return "Text"; },
		                      [](const Paragraph&) { return "Paragraph"; },
		                      [](const Break&) { return "Break"; },
		                      [](const PageBreak&) { return "PageBreak"; },
		                      [](const LinearLayout&) { return "LinearLayout"; },
		                      [](const TableLayout&) { return "TableLayout"; },
		                      [](const Styled&) { return "Styled"; },
		                      [](const Framed&) { return "Framed"; },
		                      [](const Padded&) { return "Padded"; },
		                  },
		    m_variant);
	}

	Element styled(Element element, Style style)
	{
		return Styled(std::move(element), std::move(style));
	}

	Element framed(Element element, LineStyle line_style)
	{
		return Framed(std::move(element), line_style);
	}

	Element padded(Element element, Margins margins)
	{
		return Padded(std::move(element), margins);
	}
}
