// by wuwbobo2021 <https://github.com/wuwbobo2021>, <wuwbobo@outlook.com>
// If you have found bugs in this program, please pull an issue, or contact me.
// Licensed under LGPL version 2.1.

#ifndef SIMPLE_EASING_PLOT_REPLAY_SIGNAL_H
#define SIMPLE_EASING_PLOT_REPLAY_SIGNAL_H

#include <stdexcept>

#include <sigc++/sigc++.h>

namespace SimpleEasingPlot
{

// a signal that keeps its latest value. the value is computed once by the producer
// and handed out by reference to every slot; a slot connected later receives the
// held value immediately (if any) instead of waiting for the next emission.
template <typename T>
class ReplaySignal
{
public:
	using SlotType = sigc::slot<void, const T&>;

	ReplaySignal();
	ReplaySignal(const ReplaySignal&) = delete;
	ReplaySignal& operator=(const ReplaySignal&) = delete;

	bool has_value() const;
	const T& value() const; //throws std::logic_error if nothing is held

	T& edit(); //modifies the held value in place (marks it as held), call emit() afterwards
	void emit(); //notifies all slots with the held value
	void emit(const T& val);

	sigc::connection connect(const SlotType& slot, bool replay = true);
	bool empty() const; //no slot is connected

	void reset(); //drops the held value without notifying

private:
	T val;
	bool flag_value = false;
	sigc::signal<void(const T&)> sig;
};

template <typename T>
inline ReplaySignal<T>::ReplaySignal(): val() {}

template <typename T>
inline bool ReplaySignal<T>::has_value() const
{
	return this->flag_value;
}

template <typename T>
inline const T& ReplaySignal<T>::value() const
{
	if (! this->flag_value)
		throw std::logic_error("ReplaySignal::value(): no value has been emitted.");
	return this->val;
}

template <typename T>
inline T& ReplaySignal<T>::edit()
{
	this->flag_value = true;
	return this->val;
}

template <typename T>
inline void ReplaySignal<T>::emit()
{
	if (! this->flag_value) return;
	this->sig.emit(this->val);
}

template <typename T>
inline void ReplaySignal<T>::emit(const T& val)
{
	this->val = val; this->flag_value = true;
	this->sig.emit(this->val);
}

template <typename T>
inline sigc::connection ReplaySignal<T>::connect(const SlotType& slot, bool replay)
{
	sigc::connection conn = this->sig.connect(slot);
	if (replay && this->flag_value) slot(this->val);
	return conn;
}

template <typename T>
inline bool ReplaySignal<T>::empty() const
{
	return this->sig.empty();
}

template <typename T>
inline void ReplaySignal<T>::reset()
{
	this->val = T();
	this->flag_value = false;
}

}
#endif

