#pragma once

#include <memory>

namespace lazyiter {

class Bool;
class Integer;
class Iterator;
class List;
class NativeFunction;
class NoneType;
class Object;
class String;
class Tuple;

template<typename T> std::shared_ptr<T> as(const std::shared_ptr<Object> &obj);

}// namespace lazyiter
