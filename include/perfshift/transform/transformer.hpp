#pragma once

#include <vector>

namespace perfshift::transform {

class Transformer {
public:
	virtual ~Transformer() = default;

	virtual void fit(const std::vector<double> &data) = 0;
	virtual void transform(std::vector<double> &data) const = 0;
	virtual void inverseTransform(std::vector<double> &data) const = 0;

	virtual void fitTransform(std::vector<double> &data) {
		fit(data);
		transform(data);
	}
};

} // namespace perfshift::transform
