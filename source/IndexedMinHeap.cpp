#include "IndexedMinHeap.h"
#include <algorithm>
#include <utility>

bool IndexedMinHeap::reserve(int capacity) {
    capacity = std::max(0, capacity);
    if (static_cast<int>(heap_.size()) == capacity) {
        return false;
    }

    heap_.assign(capacity, NOT_IN_HEAP);
    position_.assign(capacity, NOT_IN_HEAP);
    size_ = 0;
    return true;
}

void IndexedMinHeap::clear() {
    // a cancelled search can leave nodes behind so every position is reset, not just the live ones
    std::fill(position_.begin(), position_.end(), NOT_IN_HEAP);
    size_ = 0;
}

void IndexedMinHeap::setKeys(const std::vector<int>* primary, const std::vector<int>* secondary) {
    primary_ = primary;
    secondary_ = secondary;
}

bool IndexedMinHeap::push(int node) {
    if (primary_ == nullptr) return false;
    if (node < 0 || node >= static_cast<int>(position_.size())) return false;
    if (position_[node] != NOT_IN_HEAP) return false;
    if (size_ >= static_cast<int>(heap_.size())) return false;

    // append at the bottom then bubble up
    int slot = size_++;
    heap_[slot] = node;
    position_[node] = slot;
    siftUp(slot);
    return true;
}

int IndexedMinHeap::popMin() {
    if (size_ == 0) return NOT_IN_HEAP;

    int minNode = heap_[0];
    position_[minNode] = NOT_IN_HEAP;

    // move the last leaf to the root and push it back down
    size_--;
    if (size_ > 0) {
        int last = heap_[size_];
        heap_[0] = last;
        position_[last] = 0;
        siftDown(0);
    }

    return minNode;
}

bool IndexedMinHeap::decreaseKey(int node) {
    if (!contains(node)) return false;
    siftUp(position_[node]);
    return true;
}

bool IndexedMinHeap::isHeapOrdered() const {
    for (int slot = 0; slot < size_; slot++) {
        int node = heap_[slot];
        if (node < 0 || node >= static_cast<int>(position_.size())) return false;
        if (position_[node] != slot) return false;
        if (slot > 0 && !isLessOrEqual(heap_[(slot - 1) >> 1], node)) return false;
    }
    return true;
}

bool IndexedMinHeap::isLess(int a, int b) const {
    // primary key: smaller score first
    int pa = (*primary_)[a];
    int pb = (*primary_)[b];
    if (pa != pb) return pa < pb;

    // tie break on the secondary key, equal on both means neither is less
    if (secondary_ == nullptr) return false;
    return (*secondary_)[a] < (*secondary_)[b];
}

void IndexedMinHeap::siftUp(int slot) {
    while (slot > 0) {
        int parent = (slot - 1) >> 1;
        if (isLessOrEqual(heap_[parent], heap_[slot])) break;

        swapSlots(parent, slot);
        slot = parent;
    }
}

void IndexedMinHeap::siftDown(int slot) {
    while (true) {
        int left = (slot << 1) + 1;
        if (left >= size_) break;

        int right = left + 1;
        int smallest = left;
        if (right < size_ && isLess(heap_[right], heap_[left])) {
            smallest = right;
        }

        if (isLessOrEqual(heap_[slot], heap_[smallest])) break;

        swapSlots(slot, smallest);
        slot = smallest;
    }
}

void IndexedMinHeap::swapSlots(int a, int b) {
    std::swap(heap_[a], heap_[b]);
    position_[heap_[a]] = a;
    position_[heap_[b]] = b;
}
