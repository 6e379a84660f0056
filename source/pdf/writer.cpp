// writer.cpp
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "pdf/object.h" // for Object
#include "pdf/writer.h" // for Writer

namespace pdf
{
	size_t Writer::position() const
	{
		return m_buffer.size();
	}

	void Writer::write(const Object* obj)
	{
		obj->write(this);
	}

	size_t Writer::write(zst::str_view sv)
	{
		return this->writeBytes(reinterpret_cast<const uint8_t*>(sv.data()), sv.size());
	}

	size_t Writer::writeBytes(const uint8_t* bytes, size_t len)
	{
		m_buffer.append(bytes, len);
		return len;
	}

	size_t Writer::writeln(zst::str_view sv)
	{
		return this->write(sv) + this->write("\n");
	}

	size_t Writer::writeln()
	{
		return this->writeln("");
	}

	zst::byte_buffer Writer::take()
	{
		return std::move(m_buffer);
	}
}
