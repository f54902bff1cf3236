#include "hexball/math/vector_math.hpp"

#include <algorithm>
#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position::Position(const Vector& v) : x(v.x), y(v.y) {}

Position& Position::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

double Position::dist(const Position& p) const {
  return (Vector(*this) - Vector(p)).length();
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector Vector::operator-() const {
    return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector& Vector::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

double Vector::length() const {
  return std::sqrt(this->lengthSquared());
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

Vector Vector::perp() const {
  return {-this->y, this->x};
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len == 0.0) {
    return {0.0, 0.0};
  }
  return {this->x / len, this->y / len};
}

Vector closestPointOnSegment(const Vector &a, const Vector &b, const Vector &p) {
  Vector const ab = b - a;
  double const denom = ab.lengthSquared();
  if (denom == 0.0) {
    return a;
  }
  double t = (p - a).dotProduct(ab) / denom;
  t = std::max(0.0, std::min(1.0, t));
  return a + ab * t;
}
