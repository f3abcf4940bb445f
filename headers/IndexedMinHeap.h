#pragma once
#include <vector>

/**
 * binary min heap over dense node ids [0..capacity) with a position table
 * so membership is O(1) and decrease key is O(log n)
 *
 * the heap does not own the keys: it reads them from two score arrays bound with
 * setKeys(). nodes order by primary key ascending, then secondary key ascending,
 * and nodes equal on both keys compare equal
 */
class IndexedMinHeap {
public:
    static constexpr int NOT_IN_HEAP = -1;

    IndexedMinHeap() = default;
    explicit IndexedMinHeap(int capacity) { reserve(capacity); }

    // storage is reallocated only when the capacity changes, returns true if it did
    bool reserve(int capacity);
    void clear();

    void setKeys(const std::vector<int>* primary, const std::vector<int>* secondary);

    bool push(int node);
    int popMin();
    // caller must have lowered the node's key before calling, the node only ever moves up
    bool decreaseKey(int node);

    bool contains(int node) const {
        return node >= 0 && node < static_cast<int>(position_.size()) && position_[node] != NOT_IN_HEAP;
    }
    int top() const { return size_ > 0 ? heap_[0] : NOT_IN_HEAP; }
    bool empty() const { return size_ == 0; }
    int size() const { return size_; }
    int getCapacity() const { return static_cast<int>(heap_.size()); }

    // debugging: checks heap order and that position_ mirrors heap_
    bool isHeapOrdered() const;

private:
    std::vector<int> heap_;      // heap slots -> node id
    std::vector<int> position_;  // node id -> heap slot or NOT_IN_HEAP
    int size_ = 0;

    const std::vector<int>* primary_ = nullptr;
    const std::vector<int>* secondary_ = nullptr;

    bool isLess(int a, int b) const;
    bool isLessOrEqual(int a, int b) const { return a == b || !isLess(b, a); }
    void siftUp(int slot);
    void siftDown(int slot);
    void swapSlots(int a, int b);
};
